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

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#define SPDLOG_NO_NAME

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

#include <pthread.h>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <boost/preprocessor/variadic/to_tuple.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h> // NOTE: There is an ordering dependecy on this header and fmt headers below
#include <spdlog/fmt/ostr.h>

// The following constexpr's are used to extract the filename
// from the full path during compile time.
constexpr const char* str_end(const char* const str) { return (*str) ? str_end(str + 1) : str; }

constexpr bool str_slant(const char* const str) { return (*str == '/') ? true : (*str ? str_slant(str + 1) : false); }

constexpr const char* r_slant(const char* const str) { return (*str == '/') ? (str + 1) : r_slant(str - 1); }
constexpr const char* file_name(const char* const str) { return str_slant(str) ? r_slant(str_end(str)) : str; }

#ifndef PACKAGE_NAME
#define PACKAGE_NAME textra
#endif
#ifndef PACKAGE_VERSION
#define PACKAGE_VERSION unknown
#endif

#define LEVELCHECK(mod, lvl) (module_level_##mod <= (lvl))

#define LINEOUTPUTFORMAT "[{}:{}:{}] "
#define LINEOUTPUTARGS file_name(__FILE__), __LINE__, __FUNCTION__

#define _LOGMOD_USING_LOGGER(lvl, method, mod, logger, msg, ...)                                                       \
    if (auto& _l{logger}; _l && LEVELCHECK(mod, spdlog::level::level_enum::lvl)) {                                     \
        _l->method(LINEOUTPUTFORMAT msg, LINEOUTPUTARGS, ##__VA_ARGS__);                                               \
    }

#define LOGTRACEMOD_USING_LOGGER(mod, logger, msg, ...) _LOGMOD_USING_LOGGER(trace, trace, mod, logger, msg, ##__VA_ARGS__)
#define LOGDEBUGMOD_USING_LOGGER(mod, logger, msg, ...) _LOGMOD_USING_LOGGER(debug, debug, mod, logger, msg, ##__VA_ARGS__)
#define LOGINFOMOD_USING_LOGGER(mod, logger, msg, ...) _LOGMOD_USING_LOGGER(info, info, mod, logger, msg, ##__VA_ARGS__)
#define LOGWARNMOD_USING_LOGGER(mod, logger, msg, ...) _LOGMOD_USING_LOGGER(warn, warn, mod, logger, msg, ##__VA_ARGS__)
#define LOGERRORMOD_USING_LOGGER(mod, logger, msg, ...) _LOGMOD_USING_LOGGER(err, error, mod, logger, msg, ##__VA_ARGS__)

// Critical messages go to the critical logger as well as the regular one
#define LOGCRITICALMOD_USING_LOGGER(mod, logger, msg, ...)                                                             \
    _LOGMOD_USING_LOGGER(critical, critical, mod, textra::logging::GetCriticalLogger(), msg, ##__VA_ARGS__)            \
    _LOGMOD_USING_LOGGER(critical, critical, mod, logger, msg, ##__VA_ARGS__)

#define LOGTRACEMOD(mod, msg, ...) LOGTRACEMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)
#define LOGDEBUGMOD(mod, msg, ...) LOGDEBUGMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)
#define LOGINFOMOD(mod, msg, ...) LOGINFOMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)
#define LOGWARNMOD(mod, msg, ...) LOGWARNMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)
#define LOGERRORMOD(mod, msg, ...) LOGERRORMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)
#define LOGCRITICALMOD(mod, msg, ...)                                                                                  \
    LOGCRITICALMOD_USING_LOGGER(mod, textra::logging::GetLogger(), msg, ##__VA_ARGS__)

#define LOGTRACE(msg, ...) LOGTRACEMOD(base, msg, ##__VA_ARGS__)
#define LOGDEBUG(msg, ...) LOGDEBUGMOD(base, msg, ##__VA_ARGS__)
#define LOGINFO(msg, ...) LOGINFOMOD(base, msg, ##__VA_ARGS__)
#define LOGWARN(msg, ...) LOGWARNMOD(base, msg, ##__VA_ARGS__)
#define LOGERROR(msg, ...) LOGERRORMOD(base, msg, ##__VA_ARGS__)
#define LOGCRITICAL(msg, ...) LOGCRITICALMOD(base, msg, ##__VA_ARGS__)

#ifndef NDEBUG
#define DLOGERROR(...) LOGERROR(__VA_ARGS__)
#define DLOGWARN(...) LOGWARN(__VA_ARGS__)
#define DLOGINFO(...) LOGINFO(__VA_ARGS__)
#define DLOGDEBUG(...) LOGDEBUG(__VA_ARGS__)
#define DLOGDEBUGMOD(...) LOGDEBUGMOD(__VA_ARGS__)
#else
#define DLOGERROR(...)
#define DLOGWARN(...)
#define DLOGINFO(...)
#define DLOGDEBUG(...)
#define DLOGDEBUGMOD(...)
#endif

namespace textra {
namespace logging {

typedef spdlog::logger logger_t;

/* Per thread cached copy of the global loggers, so the hot path does not touch a shared_ptr owned by another thread */
class LoggerThreadContext {
public:
    LoggerThreadContext(const LoggerThreadContext&) = delete;
    LoggerThreadContext& operator=(const LoggerThreadContext&) = delete;
    LoggerThreadContext(LoggerThreadContext&&) noexcept = delete;
    LoggerThreadContext& operator=(LoggerThreadContext&&) noexcept = delete;
    ~LoggerThreadContext();

    static LoggerThreadContext& instance();

    static std::mutex s_logger_thread_mutex;
    static std::unordered_set< LoggerThreadContext* > s_logger_thread_set;

    std::shared_ptr< spdlog::logger > m_logger;
    std::shared_ptr< spdlog::logger > m_critical_logger;
    pthread_t m_thread_id;

private:
    LoggerThreadContext();
};

using module_entry_t = std::pair< const char*, spdlog::level::level_enum* >;

class InitModules {
public:
    InitModules(std::initializer_list< module_entry_t > list) { init_modules(list); }
    InitModules(const InitModules&) = delete;
    InitModules& operator=(const InitModules&) = delete;
    InitModules(InitModules&&) noexcept = delete;
    InitModules& operator=(InitModules&&) noexcept = delete;
    ~InitModules() = default;

private:
    void init_modules(std::initializer_list< module_entry_t > mods_list);
};

#define logger_thread_ctx LoggerThreadContext::instance()

[[maybe_unused]] extern std::shared_ptr< spdlog::logger >& GetLogger();
[[maybe_unused]] extern std::shared_ptr< spdlog::logger >& GetCriticalLogger();

} // namespace logging
} // namespace textra

#define MODLEVELDEC(r, _, module)                                                                                      \
    extern "C" {                                                                                                       \
    extern spdlog::level::level_enum BOOST_PP_CAT(module_level_, module);                                              \
    }
MODLEVELDEC(_, _, base)

#define MODLEVELDEF(r, l, module)                                                                                      \
    extern "C" {                                                                                                       \
    spdlog::level::level_enum BOOST_PP_CAT(module_level_, module){l};                                                  \
    }

#define MOD_LEVEL_ENTRY(r, _, module) {BOOST_PP_STRINGIZE(module), &BOOST_PP_CAT(module_level_, module)},

#define TEXTRA_LOGGING_DECL(...) BOOST_PP_SEQ_FOR_EACH(MODLEVELDEC, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))

#define TEXTRA_LOGGING_INIT(...)                                                                                       \
    BOOST_PP_SEQ_FOR_EACH(MODLEVELDEF, spdlog::level::level_enum::info,                                                \
                          BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_VARIADIC_TO_TUPLE(__VA_ARGS__)))                              \
    static textra::logging::InitModules BOOST_PP_CAT(s_init_enabled_mods_, __LINE__){                                  \
        BOOST_PP_SEQ_FOR_EACH(MOD_LEVEL_ENTRY, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))};

namespace textra {
namespace logging {

extern void SetLogger(std::string const& name, std::string const& pkg = BOOST_PP_STRINGIZE(PACKAGE_NAME),
                      const std::string& ver = BOOST_PP_STRINGIZE(PACKAGE_VERSION));
extern void SetLogPattern(const std::string& pattern, const std::shared_ptr< logger_t >& logger = nullptr);

/* Returns false if the module was never registered via TEXTRA_LOGGING_INIT */
extern bool SetModuleLogLevel(const std::string& module_name, const spdlog::level::level_enum level);
extern spdlog::level::level_enum GetModuleLogLevel(const std::string& module_name);
extern nlohmann::json GetAllModuleLogLevel();
extern void SetAllModuleLogLevel(const spdlog::level::level_enum level);

} // namespace logging
} // namespace textra

#define TEXTRA_LOG_LEVEL(mod, lvl) BOOST_PP_CAT(module_level_, mod) = (lvl);
