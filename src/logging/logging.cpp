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
#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "textra/logging/logging.h"
#include "textra/options/options.h"

// clang-format off
TEXTRA_OPTION_GROUP(logging, (enab_mods,  "", "log_mods", "Module loggers to enable", ::cxxopts::value<std::string>(), "mod[:level][,mod2[:level2],...]"), \
                            (async_size, "", "log_queue", "Size of async log queue", ::cxxopts::value<uint32_t>()->default_value("4096"), "(power of 2)"), \
                            (log_name,   "l", "logfile", "Full path to logfile", ::cxxopts::value<std::string>(), "logfile"), \
                            (rot_limit,  "",  "logfile_cnt", "Number of rotating files", ::cxxopts::value<uint32_t>()->default_value("5"), "count"), \
                            (size_limit, "",  "logfile_size", "Maximum logfile size", ::cxxopts::value<uint32_t>()->default_value("25"), "MiB"), \
                            (standout,   "c", "stdout", "Stdout logging only", ::cxxopts::value<bool>(), ""), \
                            (quiet,      "q", "quiet", "Disable all console logging", ::cxxopts::value<bool>(), ""), \
                            (synclog,    "s", "synclog", "Synchronized logging", ::cxxopts::value<bool>(), ""), \
                            (flush,      "",  "flush_every", "Flush logs on level (sync mode) or periodically (async mode)", ::cxxopts::value<uint32_t>()->default_value("2"), "level/seconds"), \
                            (verbosity,  "v", "verbosity", "Verbosity filter (0-5)", ::cxxopts::value<std::string>(), "level"))
// clang-format on

// logger required define if not inited
extern "C" {
spdlog::level::level_enum module_level_base{spdlog::level::level_enum::info};
}

namespace textra {
namespace logging {

constexpr uint64_t Ki{1024};
constexpr uint64_t Mi{Ki * Ki};

static std::shared_ptr< spdlog::logger > glob_spdlog_logger;
static std::shared_ptr< spdlog::logger > glob_critical_logger;

// Constant initialized, so modules registered from other translation units during dynamic init find it ready
static constexpr size_t MAX_MODULES{64};
static std::array< module_entry_t, MAX_MODULES > glob_enabled_mods{module_entry_t{"base", &module_level_base}};
static size_t glob_num_mods{1};

/****************************** LoggerThreadContext ******************************/
std::mutex LoggerThreadContext::s_logger_thread_mutex;
std::unordered_set< LoggerThreadContext* > LoggerThreadContext::s_logger_thread_set;

LoggerThreadContext::LoggerThreadContext() {
    m_thread_id = pthread_self();
    std::unique_lock l{s_logger_thread_mutex};
    s_logger_thread_set.insert(this);
}

LoggerThreadContext::~LoggerThreadContext() {
    std::unique_lock l{s_logger_thread_mutex};
    s_logger_thread_set.erase(this);
}

LoggerThreadContext& LoggerThreadContext::instance() {
    static thread_local LoggerThreadContext inst{};
    return inst;
}

/******************************** InitModules *********************************/
void InitModules::init_modules(std::initializer_list< module_entry_t > mods_list) {
    if (glob_num_mods + mods_list.size() > MAX_MODULES) {
        throw std::length_error{fmt::format("too many log modules registered, max {}", MAX_MODULES)};
    }
    for (const auto& mod : mods_list) {
        glob_enabled_mods[glob_num_mods++] = mod;
    }
}

std::shared_ptr< spdlog::logger >& GetLogger() {
    [[unlikely]] if (!(logger_thread_ctx.m_logger)) { logger_thread_ctx.m_logger = glob_spdlog_logger; }
    return logger_thread_ctx.m_logger;
}

std::shared_ptr< spdlog::logger >& GetCriticalLogger() {
    [[unlikely]] if (!(logger_thread_ctx.m_critical_logger)) {
        logger_thread_ctx.m_critical_logger = glob_critical_logger;
    }
    return logger_thread_ctx.m_critical_logger;
}

static spdlog::level::level_enum* to_mod_log_level_ptr(const std::string& module_name) {
    for (size_t mod_num{0}; mod_num < glob_num_mods; ++mod_num) {
        if (module_name == glob_enabled_mods[mod_num].first) { return glob_enabled_mods[mod_num].second; }
    }
    return nullptr;
}

static spdlog::level::level_enum parse_level(const std::string& lvl_str) {
    // Accept both the numeric (0-6) and the named form of a level
    if ((lvl_str.size() == 1) && std::isdigit(static_cast< unsigned char >(lvl_str[0]))) {
        return static_cast< spdlog::level::level_enum >(std::strtol(lvl_str.data(), nullptr, 0));
    }
    return spdlog::level::from_str(lvl_str);
}

static std::filesystem::path get_base_dir() {
    const auto cwd{std::filesystem::current_path()};
    auto p{cwd / "logs"};
    // Construct a unique directory path based on the current time
    auto const current_time{std::chrono::system_clock::now()};
    auto const current_t{std::chrono::system_clock::to_time_t(current_time)};
    auto const current_tm{std::localtime(&current_t)};
    std::array< char, 64 > c_time;
    if (std::strftime(c_time.data(), c_time.size(), "%F_%R", current_tm)) {
        p /= c_time.data();
        std::filesystem::create_directories(p);
    }
    return p;
}

static std::filesystem::path log_path(std::string const& name) {
    std::filesystem::path p;
    if (0 < TEXTRA_OPTIONS.count("logfile")) {
        p = std::filesystem::path{TEXTRA_OPTIONS["logfile"].as< std::string >()};
    } else {
        static std::filesystem::path base_dir{get_base_dir()};
        p = base_dir / std::filesystem::path{name}.filename();
    }
    return p;
}

namespace sinks = spdlog::sinks;

template < typename N, typename S >
static void create_append_sink(N const& name, S& sinks, const std::string& extn, const bool stdout_sink) {
    if (stdout_sink) {
        sinks.push_back(std::make_shared< sinks::stdout_color_sink_mt >());
    } else {
        auto const base_path{log_path(name)};
        auto const rot_size{TEXTRA_OPTIONS["logfile_size"].as< uint32_t >() * Mi};
        auto const rot_num{TEXTRA_OPTIONS["logfile_cnt"].as< uint32_t >()};

        sinks.push_back(
            std::make_shared< sinks::rotating_file_sink_mt >(base_path.string() + extn + "_log", rot_size, rot_num));
    }
}

template < typename N, typename S >
static void set_global_logger(N const& name, S const& sinks, S const& crit_sinks) {
    if (TEXTRA_OPTIONS.count("synclog")) {
        glob_spdlog_logger = std::make_shared< spdlog::logger >(name, sinks.begin(), sinks.end());
        glob_spdlog_logger->flush_on(
            static_cast< spdlog::level::level_enum >(TEXTRA_OPTIONS["flush_every"].as< uint32_t >()));
    } else {
        spdlog::init_thread_pool(TEXTRA_OPTIONS["log_queue"].as< uint32_t >(), 1);
        glob_spdlog_logger =
            std::make_shared< spdlog::async_logger >(name, sinks.begin(), sinks.end(), spdlog::thread_pool());
    }
    glob_spdlog_logger->set_level(spdlog::level::level_enum::trace);
    spdlog::register_logger(glob_spdlog_logger);

    // Critical logger is always synchronous
    glob_critical_logger = std::make_shared< spdlog::logger >(name + "_critical", crit_sinks.begin(), crit_sinks.end());
    glob_critical_logger->flush_on(spdlog::level::err);
    glob_critical_logger->set_level(spdlog::level::level_enum::err);
    spdlog::register_logger(glob_critical_logger);
}

static std::string setup_modules() {
    std::string out_str;

    if (TEXTRA_OPTIONS.count("verbosity")) {
        const auto lvl{parse_level(TEXTRA_OPTIONS["verbosity"].as< std::string >())};
        for (size_t mod_num{0}; mod_num < glob_num_mods; ++mod_num) {
            *(glob_enabled_mods[mod_num].second) = lvl;
        }
    } else if (TEXTRA_OPTIONS.count("log_mods")) {
        std::regex re{"[\\s,]+"};
        const auto s{TEXTRA_OPTIONS["log_mods"].as< std::string >()};
        std::sregex_token_iterator it{std::cbegin(s), std::cend(s), re, -1};
        std::sregex_token_iterator reg_end;
        for (; it != reg_end; ++it) {
            auto mod_stream{std::istringstream(it->str())};
            std::string module_name, module_level;
            std::getline(mod_stream, module_name, ':');
            if (auto* const mod_level{to_mod_log_level_ptr(module_name)}; nullptr != mod_level) {
                if (std::getline(mod_stream, module_level, ':')) { *mod_level = parse_level(module_level); }
            } else {
                LOGWARN("Could not load module logger: {}", module_name);
            }
        }
    }

    for (size_t mod_num{0}; mod_num < glob_num_mods; ++mod_num) {
        fmt::format_to(std::back_inserter(out_str), "{}={}, ", glob_enabled_mods[mod_num].first,
                       spdlog::level::to_string_view(*(glob_enabled_mods[mod_num].second)));
    }
    return out_str;
}

void SetLogger(std::string const& name, std::string const& pkg, std::string const& ver) {
    std::vector< spdlog::sink_ptr > mysinks{};
    std::vector< spdlog::sink_ptr > critical_sinks{};

    if (!TEXTRA_OPTIONS.count("stdout")) {
        create_append_sink(name, mysinks, "", false /* stdout_sink */);
        create_append_sink(name, critical_sinks, "_critical", false /* stdout_sink */);
    }
    if (TEXTRA_OPTIONS.count("stdout") || (!TEXTRA_OPTIONS.count("quiet"))) {
        create_append_sink(name, mysinks, "", true /* stdout_sink */);
    }

    set_global_logger(name, mysinks, critical_sinks);

    if (0 == TEXTRA_OPTIONS.count("synclog")) {
        spdlog::flush_every(std::chrono::seconds(TEXTRA_OPTIONS["flush_every"].as< uint32_t >()));
    }

    const auto log_details{setup_modules()};
    LOGINFO("Logging initialized: {}/{}, [logmods: {}]", pkg, ver, log_details);
}

void SetLogPattern(const std::string& pattern, const std::shared_ptr< logger_t >& logger) {
    if (logger == nullptr) {
        spdlog::set_pattern(pattern);
    } else {
        logger->set_pattern(pattern);
    }
}

bool SetModuleLogLevel(const std::string& module_name, const spdlog::level::level_enum level) {
    auto* mod_level = to_mod_log_level_ptr(module_name);
    if (mod_level == nullptr) {
        LOGWARN("Unable to locate the module {} in registered modules", module_name);
        return false;
    }
    *mod_level = level;
    LOGINFO("Set module '{}' log level to '{}'", module_name, spdlog::level::to_string_view(level));
    return true;
}

spdlog::level::level_enum GetModuleLogLevel(const std::string& module_name) {
    auto* mod_level = to_mod_log_level_ptr(module_name);
    return mod_level ? *mod_level : spdlog::level::level_enum::off;
}

nlohmann::json GetAllModuleLogLevel() {
    nlohmann::json j;
    for (size_t mod_num{0}; mod_num < glob_num_mods; ++mod_num) {
        const std::string mod_name{glob_enabled_mods[mod_num].first};
        j[mod_name] = spdlog::level::to_string_view(*(glob_enabled_mods[mod_num].second)).data();
    }
    return j;
}

void SetAllModuleLogLevel(const spdlog::level::level_enum level) {
    for (size_t mod_num{0}; mod_num < glob_num_mods; ++mod_num) {
        *(glob_enabled_mods[mod_num].second) = level;
    }
}

} // namespace logging
} // namespace textra
