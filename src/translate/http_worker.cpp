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
#include <folly/executors/thread_factory/NamedThreadFactory.h>

#include "textra/translate/http_worker.hpp"
#include "textra/logging/logging.h"

TEXTRA_LOGGING_DECL(translate)

namespace textra {

std::mutex HttpWorker::s_workers_mtx;
std::unordered_map< std::string, HttpWorker::UPtr > HttpWorker::s_workers;

HttpWorker::~HttpWorker() { shutdown(); }

void HttpWorker::shutdown() {
    auto expected{WorkerState::RUNNING};
    if (m_state.compare_exchange_strong(expected, WorkerState::SHUTTING_DOWN)) {
        m_executor->join();
        m_executor.reset();
        m_state = WorkerState::TERMINATED;
        LOGDEBUGMOD(translate, "http worker {} terminated", m_name);
    }
}

void HttpWorker::run(uint32_t num_threads) {
    if (m_state.load() != WorkerState::INIT) { throw std::logic_error("http worker " + m_name + " already started"); }
    if (num_threads == 0) { throw(std::invalid_argument("Need atleast one worker thread")); }

    // thread names are capped at 15 chars by pthread_setname_np
    m_executor = std::make_unique< folly::CPUThreadPoolExecutor >(
        num_threads, std::make_shared< folly::NamedThreadFactory >(m_name.substr(0, 12)));
    m_state = WorkerState::RUNNING;
    LOGINFOMOD(translate, "http worker {} started with {} threads", m_name, num_threads);
}

HttpWorker* HttpWorker::create_worker(const std::string& name, uint32_t num_threads) {
    std::lock_guard< std::mutex > lock(s_workers_mtx);
    if (auto it = s_workers.find(name); it != s_workers.end()) { return it->second.get(); }

    auto worker = std::make_unique< HttpWorker >(name);
    worker->run(num_threads);
    auto ret = worker.get();
    s_workers.insert(std::make_pair(name, std::move(worker)));
    return ret;
}

HttpWorker* HttpWorker::get_worker(const std::string& name) {
    std::lock_guard< std::mutex > lock(s_workers_mtx);
    auto it = s_workers.find(name);
    if (it == s_workers.end()) { return nullptr; }
    return it->second.get();
}

void HttpWorker::shutdown_all() {
    std::lock_guard< std::mutex > lock(s_workers_mtx);
    for (auto& it : s_workers) {
        it.second->shutdown();
        it.second.reset();
    }
    s_workers.clear();
}

} // namespace textra
