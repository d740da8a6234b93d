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
#include <cstdlib>
#include <fstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "textra/translate/translate_config.hpp"
#include "textra/logging/logging.h"
#include "textra/options/options.h"

TEXTRA_LOGGING_DECL(translate)

// clang-format off
TEXTRA_OPTION_GROUP(translator, (env_file,        "", "env_file", "File of KEY=VALUE lines loaded into the environment", ::cxxopts::value<std::string>()->default_value(".env"), "path"), \
                               (token_url,       "", "token_url", "OAuth2 token endpoint (overrides TEXTRA_TOKEN_URL)", ::cxxopts::value<std::string>(), "url"), \
                               (translate_url,   "", "translate_url", "Translation endpoint (overrides TEXTRA_JA_EN_API_URL)", ::cxxopts::value<std::string>(), "url"), \
                               (user_name,       "", "user_name", "Translation account name (overrides TEXTRA_USER_NAME)", ::cxxopts::value<std::string>(), "name"), \
                               (http_timeout_ms, "", "http_timeout_ms", "Timeout of a single HTTP request", ::cxxopts::value<uint32_t>()->default_value("30000"), "ms"), \
                               (http_workers,    "", "http_workers", "Threads of the HTTP worker pool", ::cxxopts::value<uint32_t>()->default_value("4"), "count"))
// clang-format on

namespace textra {

std::optional< std::string > TranslatorSettings::get_env(const std::string& name) {
    auto env_var = std::getenv(name.c_str());
    return (env_var != nullptr) ? std::optional< std::string >{env_var} : std::nullopt;
}

TranslatorSettings TranslatorSettings::from_env() {
    TranslatorSettings s;
    s.api_key = get_env(env_api_key).value_or("");
    s.api_secret = get_env(env_api_secret).value_or("");
    s.user_name = get_env(env_user_name).value_or("");
    s.token_url = get_env(env_token_url).value_or(default_token_url);
    s.translate_url = get_env(env_translate_url).value_or(default_translate_url);
    return s;
}

bool TranslatorSettings::load_env_file(const std::string& path) {
    std::ifstream f{path};
    if (!f.is_open()) { return false; }

    std::string line;
    while (std::getline(f, line)) {
        boost::algorithm::trim(line);
        if (line.empty() || (line[0] == '#')) { continue; }
        if (boost::algorithm::starts_with(line, "export ")) {
            line.erase(0, 7);
            boost::algorithm::trim_left(line);
        }

        const auto eq = line.find('=');
        if ((eq == std::string::npos) || (eq == 0)) {
            LOGWARNMOD(translate, "Ignoring malformed line in env file {}: {}", path, line);
            continue;
        }
        auto key = boost::algorithm::trim_copy(line.substr(0, eq));
        auto value = boost::algorithm::trim_copy(line.substr(eq + 1));
        if ((value.size() >= 2) && ((value.front() == '"') || (value.front() == '\'')) &&
            (value.back() == value.front())) {
            value = value.substr(1, value.size() - 2);
        }
        ::setenv(key.c_str(), value.c_str(), 1 /* overwrite */);
    }
    return true;
}

TranslatorSettings TranslatorSettings::load() {
    const auto env_file{TEXTRA_OPTIONS["env_file"].as< std::string >()};
    if (load_env_file(env_file)) {
        LOGINFOMOD(translate, "Loaded environment from {}", env_file);
    } else if (TEXTRA_OPTIONS.count("env_file")) {
        LOGWARNMOD(translate, "Env file {} could not be read, using the process environment only", env_file);
    }

    auto s{from_env()};
    if (TEXTRA_OPTIONS.count("token_url")) { s.token_url = TEXTRA_OPTIONS["token_url"].as< std::string >(); }
    if (TEXTRA_OPTIONS.count("translate_url")) {
        s.translate_url = TEXTRA_OPTIONS["translate_url"].as< std::string >();
    }
    if (TEXTRA_OPTIONS.count("user_name")) { s.user_name = TEXTRA_OPTIONS["user_name"].as< std::string >(); }
    s.http_timeout_ms = TEXTRA_OPTIONS["http_timeout_ms"].as< uint32_t >();
    s.http_workers = TEXTRA_OPTIONS["http_workers"].as< uint32_t >();
    return s;
}

} // namespace textra
