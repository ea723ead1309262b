// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2024-2025 clawdesk contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace clawdesk::app {

/**
 * @brief Worker pool that keeps blocking OS calls off the caller's thread.
 *
 * One io_context, a work guard and N threads. Supervisor commands share a
 * strand so they run in submission order; downloads go straight to the pool
 * and run side by side.
 *
 * ## Shutdown Behavior
 *
 * - `stop()`: releases the work guard; already-posted work still runs
 * - `join()`: blocks until the workers have drained the queue and exited
 */
class WorkCoordinator {
public:
    WorkCoordinator();

    /// Calls stop() and join() if still running.
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Spawn the worker threads.
     *
     * @param numThreads thread count (default: 2, minimum 1)
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /// Stop accepting new work once the queue drains. Idempotent.
    void stop();

    /// Wait for all workers to exit. Call stop() first. Idempotent.
    void join();

    [[nodiscard]] boost::asio::io_context::executor_type getExecutor() const noexcept;

    /// Serial (FIFO) execution context on the shared pool.
    [[nodiscard]] boost::asio::strand<boost::asio::io_context::executor_type> makeStrand() const;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] std::size_t getWorkerCount() const noexcept;

private:
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::thread> workers_;
    bool started_ = false;
};

} // namespace clawdesk::app
