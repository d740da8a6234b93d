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

#include "textra/tool/translate_tool.hpp"
#include "textra/logging/logging.h"

TEXTRA_LOGGING_INIT(tool)

namespace textra {

TranslateTool::TranslateTool(std::shared_ptr< TranslationClient > client) : m_client{std::move(client)} {
    if (!m_client) { throw std::invalid_argument("TranslateTool needs a translation client"); }
}

AsyncResult< std::string > TranslateTool::translate_ja_to_en(std::string text) {
    return m_client->async_translate(std::move(text));
}

std::pair< bool, std::string > TranslateTool::run(const std::string& text) {
    auto res = [&]() -> Result< std::string > {
        try {
            return translate_ja_to_en(text).get();
        } catch (const std::exception& e) {
            // worker rejected the job or the future was broken
            return make_error(ErrorKind::UNEXPECTED, fmt::format("Error during translation: {}", e.what()), e.what());
        }
    }();

    if (res) {
        LOGINFOMOD(tool, "Successfully translated text: '{}' -> '{}'", text, res.value());
        return {true, std::move(res).value()};
    }

    const auto& err = res.error();
    LOGERRORMOD(tool, "{} failed with {}", name, err.to_string());
    return {false, user_message(err)};
}

std::string TranslateTool::user_message(const TranslationError& err) {
    switch (err.kind()) {
    case ErrorKind::CONFIGURATION:
        return "Translation failed due to a configuration issue. Please check the server setup.";
    case ErrorKind::AUTHENTICATION:
        return "Translation failed due to an authentication issue. Please check the API credentials.";
    case ErrorKind::NETWORK:
        return "Translation failed due to a network issue. Please check your connection or try again later.";
    case ErrorKind::REMOTE_API:
        return "Translation failed due to an API error. Please try again later.";
    case ErrorKind::UNEXPECTED:
    default:
        return "An unexpected error occurred during translation. Please try again.";
    }
}

} // namespace textra
