/*********************************************************************************
 * Modifications Copyright 2017-2019 eBay Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed
 * under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied. See the License for the
 * specific language governing permissions and limitations under the License.
 *
 *********************************************************************************/
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "textra/logging/logging.h"
#include "textra/options/options.h"
#include "textra/translate/translate_config.hpp"

TEXTRA_OPTIONS_ENABLE(logging, translator)

namespace textra::testing {

static std::string get_cur_file_dir() {
    const std::string cur_file_path{__FILE__};
    const auto last_slash_pos{cur_file_path.rfind('/')};
    if (last_slash_pos == std::string::npos) { return ""; }
    return std::string{cur_file_path.substr(0, last_slash_pos + 1)};
}

static const std::string env_path{"/tmp/textra_test_config.env"};

static void unset_all() {
    for (const auto& name : {TranslatorSettings::env_api_key, TranslatorSettings::env_api_secret,
                             TranslatorSettings::env_user_name, TranslatorSettings::env_token_url,
                             TranslatorSettings::env_translate_url}) {
        ::unsetenv(name.c_str());
    }
}

class TranslateConfigTest : public ::testing::Test {
public:
    void SetUp() override { unset_all(); }
    void TearDown() override {
        unset_all();
        std::remove(env_path.c_str());
    }

    static void write_env_file(const std::string& contents) {
        std::ofstream outfile{env_path};
        outfile << contents;
        outfile.close();
    }
};

TEST_F(TranslateConfigTest, defaults_without_environment) {
    const auto s = TranslatorSettings::from_env();
    EXPECT_TRUE(s.api_key.empty());
    EXPECT_TRUE(s.api_secret.empty());
    EXPECT_TRUE(s.user_name.empty());
    EXPECT_EQ(s.token_url, "https://mt-auto-minhon-mlt.ucri.jgn-x.jp/oauth2/token.php");
    EXPECT_EQ(s.translate_url, "https://mt-auto-minhon-mlt.ucri.jgn-x.jp/api/mt/generalNT_ja_en/");
    EXPECT_EQ(s.http_timeout_ms, 30000u);
    EXPECT_EQ(s.http_workers, 4u);
}

TEST_F(TranslateConfigTest, reads_environment) {
    ::setenv("TEXTRA_API_KEY", "key", 1);
    ::setenv("TEXTRA_API_SECRET", "secret", 1);
    ::setenv("TEXTRA_USER_NAME", "user", 1);
    ::setenv("TEXTRA_TOKEN_URL", "http://127.0.0.1:12347/token", 1);
    ::setenv("TEXTRA_JA_EN_API_URL", "http://127.0.0.1:12347/translate", 1);

    const auto s = TranslatorSettings::from_env();
    EXPECT_EQ(s.api_key, "key");
    EXPECT_EQ(s.api_secret, "secret");
    EXPECT_EQ(s.user_name, "user");
    EXPECT_EQ(s.token_url, "http://127.0.0.1:12347/token");
    EXPECT_EQ(s.translate_url, "http://127.0.0.1:12347/translate");

    const auto creds = s.credentials();
    EXPECT_EQ(creds.api_key, "key");
    EXPECT_EQ(creds.api_secret, "secret");
    EXPECT_EQ(creds.token_url, "http://127.0.0.1:12347/token");
}

TEST_F(TranslateConfigTest, empty_variable_is_not_replaced_by_default) {
    ::setenv("TEXTRA_TOKEN_URL", "", 1);
    EXPECT_TRUE(TranslatorSettings::from_env().token_url.empty());
}

TEST_F(TranslateConfigTest, loads_env_file) {
    ::setenv("TEXTRA_USER_NAME", "from_process", 1);
    write_env_file("# credentials\n"
                   "\n"
                   "TEXTRA_API_KEY=file_key\n"
                   "export TEXTRA_API_SECRET = \"quoted secret\"\n"
                   "TEXTRA_USER_NAME='file_user'\n"
                   "not a setting\n");
    ASSERT_TRUE(TranslatorSettings::load_env_file(env_path));

    const auto s = TranslatorSettings::from_env();
    EXPECT_EQ(s.api_key, "file_key");
    EXPECT_EQ(s.api_secret, "quoted secret");
    EXPECT_EQ(s.user_name, "file_user");
}

TEST_F(TranslateConfigTest, missing_env_file) {
    EXPECT_FALSE(TranslatorSettings::load_env_file(get_cur_file_dir() + "does_not_exist.env"));
}

TEST_F(TranslateConfigTest, load_uses_option_defaults) {
    ::setenv("TEXTRA_API_KEY", "key", 1);
    const auto s = TranslatorSettings::load();
    EXPECT_EQ(s.api_key, "key");
    EXPECT_EQ(s.token_url, TranslatorSettings::default_token_url);
    EXPECT_EQ(s.http_timeout_ms, 30000u);
    EXPECT_EQ(s.http_workers, 4u);
}

} // namespace textra::testing

int main(int argc, char* argv[]) {
    ::testing::InitGoogleTest(&argc, argv);
    TEXTRA_OPTIONS_LOAD(argc, argv, logging, translator)
    textra::logging::SetLogger("test_translate_config");
    spdlog::set_pattern("[%D %T%z] [%^%l%$] [%t] %v");
    return RUN_ALL_TESTS();
}
