/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    /**
     * @brief Runs a task once after a delay
     *
     * Retry backoff goes through this interface so the pump never sleeps
     * between a failed attempt and the next one.
     */
    class ITimerService {
    public:
        using Task = std::function<void()>;

        virtual ~ITimerService() = default;

        virtual void schedule(std::chrono::milliseconds delay, Task task) = 0;

        /// Tasks scheduled but not yet run
        virtual size_t pendingCount() const = 0;
    };

    using TimerServicePtr = std::shared_ptr<ITimerService>;

    /**
     * @brief ITimerService on one background thread
     *
     * Tasks run in due-time order (ties in scheduling order) on the timer
     * thread. Destroying the service drops tasks that have not run yet.
     */
    class ThreadTimerService : public ITimerService {
    public:
        ThreadTimerService();
        ~ThreadTimerService() override;

        ThreadTimerService(const ThreadTimerService&) = delete;
        ThreadTimerService& operator=(const ThreadTimerService&) = delete;

        void schedule(std::chrono::milliseconds delay, Task task) override;
        size_t pendingCount() const override;

    private:
        struct Entry {
            std::chrono::steady_clock::time_point due;
            uint64_t sequence;
            Task task;
        };

        struct Later {
            bool operator()(const Entry& a, const Entry& b) const {
                if (a.due != b.due) return a.due > b.due;
                return a.sequence > b.sequence;
            }
        };

        void run(const std::stop_token& token);

        mutable std::mutex _mutex;
        std::condition_variable_any _wakeCV;
        std::priority_queue<Entry, std::vector<Entry>, Later> _entries;
        uint64_t _nextSequence = 0;
        std::jthread _thread;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
