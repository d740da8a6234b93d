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

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include <folly/Executor.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>

namespace textra {

enum class WorkerState : uint8_t { INIT, RUNNING, SHUTTING_DOWN, TERMINATED };

/**
 * A named pool of threads that run blocking HTTP exchanges off the caller's thread.
 *
 * Workers are created once by name and live until HttpWorker::shutdown_all().
 */
class HttpWorker final {
public:
    using UPtr = std::unique_ptr< HttpWorker >;

    explicit HttpWorker(std::string name) : m_name{std::move(name)} {}
    ~HttpWorker();
    HttpWorker(const HttpWorker&) = delete;
    HttpWorker& operator=(const HttpWorker&) = delete;

    void run(uint32_t num_threads);

    template < typename F >
    auto submit(F&& f) {
        if (m_state.load() != WorkerState::RUNNING) {
            throw std::logic_error("http worker " + m_name + " is not running");
        }
        return folly::via(folly::getKeepAliveToken(m_executor.get()), std::forward< F >(f)).semi();
    }

    bool is_running() const { return m_state.load() == WorkerState::RUNNING; }
    const std::string& name() const { return m_name; }

    static HttpWorker* create_worker(const std::string& name, uint32_t num_threads);
    static HttpWorker* get_worker(const std::string& name);

    /**
     * Must be called explicitly before program exit if any worker created.
     * Waits for every submitted exchange to complete.
     */
    static void shutdown_all();

private:
    void shutdown();

private:
    static std::mutex s_workers_mtx;
    static std::unordered_map< std::string, HttpWorker::UPtr > s_workers;

    const std::string m_name;
    std::atomic< WorkerState > m_state{WorkerState::INIT};
    std::unique_ptr< folly::CPUThreadPoolExecutor > m_executor;
};

} // namespace textra
