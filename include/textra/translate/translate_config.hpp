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
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "textra/auth/oauth_token_client.hpp"

namespace textra {

/**
 * Everything the translator needs to talk to the token and translation endpoints.
 *
 * Nothing is validated here: a missing value only becomes an error when the operation that needs it runs.
 */
struct TranslatorSettings {
    inline static const std::string env_api_key{"TEXTRA_API_KEY"};
    inline static const std::string env_api_secret{"TEXTRA_API_SECRET"};
    inline static const std::string env_user_name{"TEXTRA_USER_NAME"};
    inline static const std::string env_token_url{"TEXTRA_TOKEN_URL"};
    inline static const std::string env_translate_url{"TEXTRA_JA_EN_API_URL"};

    inline static const std::string default_token_url{"https://mt-auto-minhon-mlt.ucri.jgn-x.jp/oauth2/token.php"};
    inline static const std::string default_translate_url{
        "https://mt-auto-minhon-mlt.ucri.jgn-x.jp/api/mt/generalNT_ja_en/"};
    static constexpr uint32_t default_http_timeout_ms{OAuthTokenClient::default_timeout_ms};
    static constexpr uint32_t default_http_workers{4};

    std::string api_key;
    std::string api_secret;
    std::string user_name;
    std::string token_url{default_token_url};
    std::string translate_url{default_translate_url};
    uint32_t http_timeout_ms{default_http_timeout_ms};
    uint32_t http_workers{default_http_workers};

    OAuthCredentials credentials() const { return OAuthCredentials{api_key, api_secret, token_url}; }

    // unset variable -> nullopt; a variable set to "" is returned as ""
    static std::optional< std::string > get_env(const std::string& name);

    static TranslatorSettings from_env();

    /**
     * Loads KEY=VALUE lines into the process environment, replacing values already set.
     * Blank lines, '#' comments, an "export " prefix and matching surrounding quotes are handled.
     * Returns false if the file could not be opened.
     */
    static bool load_env_file(const std::string& path);

    /* env file (--env_file), then environment, then command line overrides. Requires the translator option group. */
    static TranslatorSettings load();
};

} // namespace textra
