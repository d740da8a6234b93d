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

#include <memory>
#include <string>
#include <vector>

#undef HTTP_OK // nameclash with cpr/cpr.h header
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include "textra/auth/token_client.hpp"
#include "textra/common/translate_error.hpp"
#include "textra/translate/http_worker.hpp"
#include "textra/translate/translate_config.hpp"

namespace textra {

/**
 * Client of the Japanese to English machine translation endpoint.
 *
 * translate() blocks on two HTTP exchanges at most (token refresh and the translation POST). async_translate() runs
 * the same call on an HttpWorker so the caller only waits on a future.
 */
class TranslationClient {
public:
    TranslationClient(TranslatorSettings settings, std::shared_ptr< TokenClient > token_client,
                      HttpWorker* worker = nullptr);
    virtual ~TranslationClient() = default;
    TranslationClient(const TranslationClient&) = delete;
    TranslationClient& operator=(const TranslationClient&) = delete;

    Result< std::string > translate(const std::string& text);

    /* Runs inline when there is no worker or the worker is not running. The client must outlive the future. */
    AsyncResult< std::string > async_translate(std::string text);

    const TranslatorSettings& settings() const { return m_settings; }

    // "0" is success; numbers render as their JSON text and a missing code as "null"
    static std::string result_code_string(const nlohmann::json& resultset);

protected:
    // Blocking form POST to translate_url; transport failures are reported through resp.error
    virtual cpr::Response post_translate(const std::vector< cpr::Pair >& fields);

    Result< std::string > parse_translation(const std::string& body) const;

private:
    bool settings_configured() const;

protected:
    const TranslatorSettings m_settings;

private:
    std::shared_ptr< TokenClient > m_token_client;
    HttpWorker* m_worker;
};

} // namespace textra
