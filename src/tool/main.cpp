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
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "textra/auth/oauth_token_client.hpp"
#include "textra/logging/logging.h"
#include "textra/options/options.h"
#include "textra/tool/translate_tool.hpp"
#include "textra/translate/http_worker.hpp"
#include "textra/translate/translate_config.hpp"
#include "textra/translate/translation_client.hpp"

TEXTRA_LOGGING_DECL(tool)

// clang-format off
TEXTRA_OPTION_GROUP(translate_tool, (text, "t", "text", "Japanese text to translate, read from stdin if absent", ::cxxopts::value<std::string>(), "text"))
// clang-format on

TEXTRA_OPTIONS_ENABLE(logging, translator, translate_tool)

static const std::string http_worker_name{"textra_http"};

static std::string read_input() {
    if (TEXTRA_OPTIONS.count("text")) { return TEXTRA_OPTIONS["text"].as< std::string >(); }
    std::string input{std::istreambuf_iterator< char >(std::cin), std::istreambuf_iterator< char >()};
    while (!input.empty() && ((input.back() == '\n') || (input.back() == '\r'))) {
        input.pop_back();
    }
    return input;
}

int main(int argc, char* argv[]) {
    TEXTRA_OPTIONS_LOAD(argc, argv, logging, translator, translate_tool)
    textra::logging::SetLogger("textra_translate");
    spdlog::set_pattern("[%D %T%z] [%^%l%$] [%t] %v");

    textra::HttpWorker* worker{nullptr};
    std::shared_ptr< textra::TranslateTool > tool;
    try {
        const auto settings{textra::TranslatorSettings::load()};
        worker = textra::HttpWorker::create_worker(http_worker_name, settings.http_workers);
        auto token_client = std::make_shared< textra::OAuthTokenClient >(
            settings.credentials(), nullptr, textra::steady_now, settings.http_timeout_ms);
        tool = std::make_shared< textra::TranslateTool >(
            std::make_shared< textra::TranslationClient >(settings, std::move(token_client), worker));
    } catch (const std::exception& e) {
        LOGERRORMOD(tool, "Failed to set up the translator: {}", e.what());
        std::cerr << "textra_translate: " << e.what() << std::endl;
        textra::HttpWorker::shutdown_all();
        return 1;
    }

    const auto text{read_input()};
    LOGINFOMOD(tool, "{} requested for {} bytes of text", textra::TranslateTool::name, text.size());
    const auto [ok, output] = tool->run(text);
    std::cout << output << std::endl;

    textra::HttpWorker::shutdown_all();
    return ok ? 0 : 1;
}
