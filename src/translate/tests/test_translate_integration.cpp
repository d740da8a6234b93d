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
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "textra/auth/oauth_token_client.hpp"
#include "textra/logging/logging.h"
#include "textra/options/options.h"
#include "textra/tool/translate_tool.hpp"
#include "textra/translate/http_worker.hpp"
#include "textra/translate/translation_client.hpp"
#include "mock_textra_server.hpp"

TEXTRA_OPTIONS_ENABLE(logging)

namespace textra::testing {
using namespace ::testing;

static const std::string server_ip{"127.0.0.1"};
static const uint32_t server_port{12347};
static const std::string server_url{fmt::format("http://{}:{}", server_ip, server_port)};

static const std::string translate_ok{
    R"({"resultset":{"code":0,"message":"","request":{"text":"こんにちは"},"result":{"text":"Hello","information":{}}}})"};

// Real cpr exchanges against a local server on 127.0.0.1:12347
class TranslateIntegrationTest : public ::testing::Test {
public:
    void SetUp() override {
        m_server = std::make_unique< MockTextraServer >(fmt::format("{}:{}", server_ip, server_port), 1);
        m_server->set_token_response(Pistache::Http::Code::Ok,
                                     R"({"access_token":"it_token","token_type":"Bearer","expires_in":3600})");
        m_server->set_translate_response(translate_ok);
        m_server->start();

        TranslatorSettings s;
        s.api_key = "it_key";
        s.api_secret = "it_secret";
        s.user_name = "it_user";
        s.token_url = server_url + "/token";
        s.translate_url = server_url + "/translate";
        s.http_timeout_ms = 5000;

        m_worker = HttpWorker::create_worker("it_http", 2);
        m_token_client =
            std::make_shared< OAuthTokenClient >(s.credentials(), nullptr, steady_now, s.http_timeout_ms);
        m_client = std::make_shared< TranslationClient >(s, m_token_client, m_worker);
    }

    void TearDown() override {
        m_client.reset();
        HttpWorker::shutdown_all();
        m_server->stop();
    }

protected:
    std::unique_ptr< MockTextraServer > m_server;
    HttpWorker* m_worker{nullptr};
    std::shared_ptr< OAuthTokenClient > m_token_client;
    std::shared_ptr< TranslationClient > m_client;
};

TEST_F(TranslateIntegrationTest, translate_end_to_end) {
    const auto res = m_client->async_translate("こんにちは").get();
    ASSERT_TRUE(res.hasValue()) << res.error();
    EXPECT_EQ(res.value(), "Hello");
    EXPECT_EQ(m_server->token_requests(), 1u);

    EXPECT_THAT(m_server->last_token_request(), HasSubstr("grant_type=client_credentials"));
    EXPECT_THAT(m_server->last_token_request(), HasSubstr("client_id=it_key"));
    EXPECT_THAT(m_server->last_token_request(), HasSubstr("client_secret=it_secret"));
    EXPECT_THAT(m_server->last_translate_request(), HasSubstr("access_token=it_token"));
    EXPECT_THAT(m_server->last_translate_request(), HasSubstr("name=it_user"));
    EXPECT_THAT(m_server->last_translate_request(), HasSubstr("type=json"));
}

TEST_F(TranslateIntegrationTest, token_is_reused) {
    for (int i = 0; i < 3; ++i) {
        const auto res = m_client->async_translate("こんにちは").get();
        ASSERT_TRUE(res.hasValue()) << res.error();
    }
    EXPECT_EQ(m_server->token_requests(), 1u);
}

TEST_F(TranslateIntegrationTest, rejected_credentials) {
    m_server->set_token_response(Pistache::Http::Code::Unauthorized, R"({"error":"invalid_client"})");
    TranslateTool tool{m_client};
    const auto [ok, output] = tool.run("こんにちは");
    EXPECT_FALSE(ok);
    EXPECT_EQ(output, "Translation failed due to an authentication issue. Please check the API credentials.");
    EXPECT_TRUE(m_token_client->cache()->empty());
}

TEST_F(TranslateIntegrationTest, remote_api_error) {
    m_server->set_translate_response(R"({"resultset":{"code":"500","message":"API key error"}})");
    const auto res = m_client->async_translate("こんにちは").get();
    ASSERT_TRUE(res.hasError());
    EXPECT_EQ(res.error().kind(), ErrorKind::REMOTE_API);
    EXPECT_THAT(res.error().message(), HasSubstr("API key error"));
    EXPECT_THAT(res.error().message(), HasSubstr("500"));
}

TEST_F(TranslateIntegrationTest, server_down_is_network_error) {
    // token is cached first so only the translation POST hits the closed port
    ASSERT_TRUE(m_token_client->get_token().hasValue());
    m_server->stop();
    const auto res = m_client->async_translate("こんにちは").get();
    ASSERT_TRUE(res.hasError());
    EXPECT_EQ(res.error().kind(), ErrorKind::NETWORK);
    EXPECT_THAT(res.error().message(), StartsWith("Network error during translation: "));
}

} // namespace textra::testing

int main(int argc, char* argv[]) {
    ::testing::InitGoogleMock(&argc, argv);
    TEXTRA_OPTIONS_LOAD(argc, argv, logging)
    textra::logging::SetLogger("test_translate_integration");
    spdlog::set_pattern("[%D %T%z] [%^%l%$] [%t] %v");
    return RUN_ALL_TESTS();
}
