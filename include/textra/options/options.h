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

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/tuple/push_front.hpp>
#include <boost/preprocessor/tuple/rem.hpp>
#include <boost/preprocessor/tuple/remove.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <boost/preprocessor/variadic/to_tuple.hpp>
#include <cxxopts.hpp>

/*
 * Command line options are declared in groups next to the code that consumes them:
 *
 *   TEXTRA_OPTION_GROUP(translator, (token_url, "", "token_url", "OAuth2 token endpoint",
 *                                    ::cxxopts::value< std::string >(), "url"))
 *
 * and an executable picks the groups it wants:
 *
 *   TEXTRA_OPTIONS_ENABLE(logging, translator)
 *   int main(int argc, char* argv[]) { TEXTRA_OPTIONS_LOAD(argc, argv, logging, translator) ... }
 *
 * The "main" group (--help) is always enabled.
 */
namespace textra {
namespace options {

using shared_opt = std::shared_ptr< cxxopts::Options >;
using shared_opt_res = std::shared_ptr< cxxopts::ParseResult >;

// Defined by TEXTRA_OPTIONS_ENABLE in the executable
extern shared_opt GetOptions() __attribute__((weak));
extern shared_opt_res GetResults() __attribute__((weak));

struct TextraOption {
    template < class... Args >
    explicit TextraOption(std::string const& group, Args... args) {
        GetOptions()->add_option(group, args...);
    }
};

/* True only when the executable enabled and loaded options, so library code can fall back to defaults */
inline bool options_loaded() { return (GetResults != nullptr) && (GetResults() != nullptr); }

} // namespace options
} // namespace textra

#define TEXTRA_OPTION(r, group, args)                                                                                  \
    textra::options::TextraOption const BOOST_PP_CAT(_option_, BOOST_PP_TUPLE_ELEM(0, args)){                          \
        BOOST_PP_STRINGIZE(group), BOOST_PP_TUPLE_REM_CTOR(BOOST_PP_TUPLE_REMOVE(args, 0))};

#define TEXTRA_OPTION_GROUP(group, ...)                                                                                \
    namespace textra {                                                                                                 \
    namespace options {                                                                                                \
    struct BOOST_PP_CAT(options_module_, group) {                                                                      \
        BOOST_PP_SEQ_FOR_EACH(TEXTRA_OPTION, (group), BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))                           \
    };                                                                                                                 \
    BOOST_PP_CAT(options_module_, group) * BOOST_PP_CAT(load_options_, group)() {                                      \
        return new BOOST_PP_CAT(options_module_, group)();                                                             \
    }                                                                                                                  \
    void BOOST_PP_CAT(unload_options_, group)(BOOST_PP_CAT(options_module_, group) * ptr) { delete ptr; }              \
    }                                                                                                                  \
    }

#define TEXTRA_OPTION_ENABLE(r, _, group)                                                                              \
    namespace textra {                                                                                                 \
    namespace options {                                                                                                \
    struct BOOST_PP_CAT(options_module_, group);                                                                       \
    BOOST_PP_CAT(options_module_, group) * BOOST_PP_CAT(load_options_, group)();                                       \
    void BOOST_PP_CAT(unload_options_, group)(BOOST_PP_CAT(options_module_, group) *);                                 \
    }                                                                                                                  \
    }                                                                                                                  \
    static std::unique_ptr< BOOST_PP_CAT(textra::options::options_module_, group),                                     \
                            decltype(&BOOST_PP_CAT(textra::options::unload_options_, group)) >                         \
        BOOST_PP_CAT(options_group_, group)(nullptr, &BOOST_PP_CAT(textra::options::unload_options_, group));

#define TEXTRA_OPTIONS_ENABLE(...)                                                                                     \
    BOOST_PP_SEQ_FOR_EACH(                                                                                             \
        TEXTRA_OPTION_ENABLE, _,                                                                                       \
        BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_TUPLE_PUSH_FRONT(BOOST_PP_VARIADIC_TO_TUPLE(__VA_ARGS__), main)))               \
    static textra::options::shared_opt options_;                                                                       \
    static textra::options::shared_opt_res results_;                                                                   \
    namespace textra {                                                                                                 \
    namespace options {                                                                                                \
    shared_opt GetOptions() { return options_; }                                                                       \
    shared_opt_res GetResults() { return results_; }                                                                   \
    }                                                                                                                  \
    }

#define TEXTRA_OPTIONS (*textra::options::GetResults())
#define TEXTRA_PARSER (*textra::options::GetOptions())

#define TEXTRA_OPTION_LOAD(r, _, group)                                                                                \
    BOOST_PP_CAT(options_group_, group) = decltype(BOOST_PP_CAT(options_group_, group))(                               \
        BOOST_PP_CAT(textra::options::load_options_, group)(), &BOOST_PP_CAT(textra::options::unload_options_, group));

#define TEXTRA_OPTIONS_LOAD(argc, argv, ...)                                                                           \
    options_ = std::make_shared< cxxopts::Options >(argv[0]);                                                          \
    BOOST_PP_SEQ_FOR_EACH(                                                                                             \
        TEXTRA_OPTION_LOAD, _,                                                                                         \
        BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_TUPLE_PUSH_FRONT(BOOST_PP_VARIADIC_TO_TUPLE(__VA_ARGS__), main)))               \
    results_ = std::make_shared< cxxopts::ParseResult >(TEXTRA_PARSER.parse(argc, argv));                              \
    if (TEXTRA_OPTIONS.count("help")) {                                                                                \
        std::cout << TEXTRA_PARSER.help({}) << std::endl;                                                              \
        std::exit(0);                                                                                                  \
    }
