// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2024-2025 clawdesk contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <clawdesk/app/work_coordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <boost/asio/detail/concurrency_hint.hpp>

namespace clawdesk::app {

namespace {
constexpr std::size_t kDefaultWorkers = 2;
}

WorkCoordinator::WorkCoordinator()
    : ioContext_(std::make_shared<boost::asio::io_context>(BOOST_ASIO_CONCURRENCY_HINT_SAFE)) {
    spdlog::debug("[WorkCoordinator] Constructed (io_context created, not started)");
}

WorkCoordinator::~WorkCoordinator() {
    if (started_) {
        stop();
        join();
    }
}

void WorkCoordinator::start(std::optional<std::size_t> numThreads) {
    if (started_) {
        throw std::runtime_error("WorkCoordinator already started");
    }

    workGuard_.emplace(boost::asio::make_work_guard(*ioContext_));
    const std::size_t workerCount = std::max<std::size_t>(1, numThreads.value_or(kDefaultWorkers));

    workers_.reserve(workerCount);
    try {
        for (std::size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back([this, i]() {
                spdlog::trace("[WorkCoordinator] Worker {} starting io_context.run()", i);
                ioContext_->run();
                spdlog::trace("[WorkCoordinator] Worker {} exited io_context.run()", i);
            });
        }
        started_ = true;
        spdlog::debug("[WorkCoordinator] Started with {} worker threads", workerCount);
    } catch (const std::system_error& e) {
        spdlog::error("[WorkCoordinator] Failed to spawn worker thread: {}", e.what());
        ioContext_->stop();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        workGuard_.reset();
        throw std::runtime_error(std::string("Failed to start WorkCoordinator: ") + e.what());
    }
}

void WorkCoordinator::stop() {
    if (!started_) {
        return;
    }
    // Let queued commands finish; their futures must still be fulfilled.
    workGuard_.reset();
    spdlog::debug("[WorkCoordinator] Work guard released");
}

void WorkCoordinator::join() {
    if (workers_.empty()) {
        return;
    }
    spdlog::debug("[WorkCoordinator] Joining {} worker threads...", workers_.size());
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    started_ = false;
    spdlog::debug("[WorkCoordinator] All workers joined");
}

boost::asio::io_context::executor_type WorkCoordinator::getExecutor() const noexcept {
    return ioContext_->get_executor();
}

boost::asio::strand<boost::asio::io_context::executor_type> WorkCoordinator::makeStrand() const {
    return boost::asio::strand<boost::asio::io_context::executor_type>(ioContext_->get_executor());
}

bool WorkCoordinator::isRunning() const noexcept {
    return started_ && !workers_.empty();
}

std::size_t WorkCoordinator::getWorkerCount() const noexcept {
    return workers_.size();
}

} // namespace clawdesk::app
