/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "TimerService.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <format>

namespace FlowEngine {
namespace Core {
namespace Flow {

    ThreadTimerService::ThreadTimerService() {
        _thread = std::jthread([this](const std::stop_token& token) {
            FLOW_PROFILE_THREAD_NAME("FlowTimer");
            run(token);
        });
    }

    ThreadTimerService::~ThreadTimerService() {
        _thread.request_stop();
        _wakeCV.notify_all();
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    void ThreadTimerService::schedule(std::chrono::milliseconds delay, Task task) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _entries.push(Entry{std::chrono::steady_clock::now() + delay, _nextSequence++, std::move(task)});
        }
        _wakeCV.notify_all();
    }

    size_t ThreadTimerService::pendingCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    void ThreadTimerService::run(const std::stop_token& token) {
        std::unique_lock<std::mutex> lock(_mutex);
        while (!token.stop_requested()) {
            if (_entries.empty()) {
                _wakeCV.wait(lock, token, [this]() { return !_entries.empty(); });
                continue;
            }

            auto due = _entries.top().due;
            if (std::chrono::steady_clock::now() < due) {
                // Woken early by a new, possibly sooner entry, or by stop
                _wakeCV.wait_until(lock, token, due, [this, due]() {
                    return _entries.empty() || _entries.top().due < due;
                });
                continue;
            }

            Task task = std::move(const_cast<Entry&>(_entries.top()).task);
            _entries.pop();

            lock.unlock();
            {
                FLOW_PROFILE_ZONE_NC("ThreadTimerService::task", Debug::ProfileColors::Timer);
                try {
                    task();
                } catch (const std::exception& e) {
                    FLOW_LOG_ERROR_CAT("Timer", std::format("Timer task threw: {}", e.what()));
                } catch (...) {
                    FLOW_LOG_ERROR_CAT("Timer", "Timer task threw a non-standard exception");
                }
            }
            lock.lock();
        }
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
