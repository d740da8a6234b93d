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
#include <utility>

#include "textra/common/translate_error.hpp"
#include "textra/translate/translation_client.hpp"

namespace textra {

/**
 * The caller-facing translate_ja_to_en operation.
 *
 * run() never fails: errors are logged in full and replaced by a message that is safe to show to an end user.
 */
class TranslateTool {
public:
    static constexpr const char* name{"translate_ja_to_en"};

    explicit TranslateTool(std::shared_ptr< TranslationClient > client);

    AsyncResult< std::string > translate_ja_to_en(std::string text);

    /* Blocks until done; the bool is false when the returned string is a user-facing error message */
    std::pair< bool, std::string > run(const std::string& text);

    static std::string user_message(const TranslationError& err);

private:
    std::shared_ptr< TranslationClient > m_client;
};

} // namespace textra
