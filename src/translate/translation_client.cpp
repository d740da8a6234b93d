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
#include <stdexcept>

#include <fmt/format.h>

#include "textra/translate/translation_client.hpp"
#include "textra/logging/logging.h"
#include "common/http_utils.hpp"

TEXTRA_LOGGING_INIT(translate)

namespace textra {

static Result< std::string > translation_failed(const std::string& cause) {
    LOGERRORMOD(translate, "Error during translation: {}", cause);
    return make_error(ErrorKind::UNEXPECTED, fmt::format("Error during translation: {}", cause), cause);
}

TranslationClient::TranslationClient(TranslatorSettings settings, std::shared_ptr< TokenClient > token_client,
                                     HttpWorker* worker) :
        m_settings{std::move(settings)}, m_token_client{std::move(token_client)}, m_worker{worker} {
    if (!m_token_client) { throw std::invalid_argument("TranslationClient needs a token client"); }
}

bool TranslationClient::settings_configured() const {
    return !(m_settings.translate_url.empty() || m_settings.user_name.empty() || m_settings.api_key.empty());
}

Result< std::string > TranslationClient::translate(const std::string& text) {
    if (!settings_configured()) {
        LOGERRORMOD(translate, "API URL, User Name, or API Key is not configured.");
        return make_error(ErrorKind::CONFIGURATION, "API URL, User Name, and API Key must be configured");
    }

    auto token = m_token_client->get_token();
    if (!token) { return folly::makeUnexpected(std::move(token).error()); }

    std::vector< cpr::Pair > fields;
    fields.emplace_back("access_token", token.value());
    fields.emplace_back("key", m_settings.api_key);
    fields.emplace_back("name", m_settings.user_name);
    fields.emplace_back("type", "json");
    fields.emplace_back("text", text);

    LOGINFOMOD(translate, "Sending translation request to {}", m_settings.translate_url);
    cpr::Response resp;
    try {
        resp = post_translate(fields);
    } catch (const std::exception& e) { return translation_failed(e.what()); }

    if (resp.error) {
        LOGERRORMOD(translate, "Network error during translation: {}", resp.error.message);
        return make_error(ErrorKind::NETWORK, fmt::format("Network error during translation: {}", resp.error.message),
                          resp.error.message);
    }
    if (!is_http_success(resp)) {
        // the endpoint reports most failures in the body, so the status alone decides nothing
        LOGWARNMOD(translate, "Translation endpoint returned status {}", resp.status_code);
    }
    return parse_translation(resp.text);
}

AsyncResult< std::string > TranslationClient::async_translate(std::string text) {
    if (m_worker != nullptr) {
        try {
            return m_worker->submit([this, text]() { return translate(text); });
        } catch (const std::logic_error& e) {
            LOGWARNMOD(translate, "Translating on the calling thread: {}", e.what());
        }
    }
    return folly::makeSemiFuture(translate(text));
}

cpr::Response TranslationClient::post_translate(const std::vector< cpr::Pair >& fields) {
    return post_form(m_settings.translate_url, fields, m_settings.http_timeout_ms);
}

std::string TranslationClient::result_code_string(const nlohmann::json& resultset) {
    auto it = resultset.find("code");
    if (it == resultset.end()) { return "null"; }
    if (it->is_string()) { return it->get< std::string >(); }
    return it->dump();
}

Result< std::string > TranslationClient::parse_translation(const std::string& body) const {
    LOGDEBUGMOD(translate, "Received API response data: {}", body);

    const auto j = nlohmann::json::parse(body, nullptr, false /* allow_exceptions */);
    if (j.is_discarded()) { return translation_failed("malformed response: body is not valid JSON"); }
    if (!j.is_object()) { return translation_failed("malformed response: not a JSON object"); }

    // an absent resultset reads as an empty one and fails below on its missing code
    static const nlohmann::json empty_resultset = nlohmann::json::object();
    auto rs_it = j.find("resultset");
    if ((rs_it != j.end()) && !rs_it->is_object()) {
        return translation_failed(fmt::format("malformed response: resultset is {}", rs_it->dump()));
    }
    const auto& resultset = (rs_it != j.end()) ? *rs_it : empty_resultset;

    const auto code = result_code_string(resultset);
    LOGDEBUGMOD(translate, "API result code: {}", code);
    if (code != "0") {
        std::string message{"Unknown error"};
        if (auto m = resultset.find("message"); (m != resultset.end()) && !m->is_null()) {
            message = m->is_string() ? m->get< std::string >() : m->dump();
        }
        auto msg = fmt::format("Translation API error: {} (code: {})", message, code);
        LOGERRORMOD(translate, "{}", msg);
        return make_error(ErrorKind::REMOTE_API, std::move(msg));
    }

    std::string translated;
    if (auto r = resultset.find("result"); (r != resultset.end()) && r->is_object()) {
        if (auto info = r->find("information"); info != r->end()) {
            LOGDEBUGMOD(translate, "Translation information: {}", info->dump());
        }
        if (auto t = r->find("text"); (t != r->end()) && !t->is_null()) {
            if (!t->is_string()) { return translation_failed(fmt::format("malformed response: result text is {}", t->dump())); }
            translated = t->get< std::string >();
        }
    } else if ((r != resultset.end()) && !r->is_null()) {
        return translation_failed("malformed response: result is not an object");
    }

    if (translated.empty()) {
        LOGWARNMOD(translate, "Translation result is empty");
    } else {
        LOGINFOMOD(translate, "Translation successful");
    }
    return translated;
}

} // namespace textra
