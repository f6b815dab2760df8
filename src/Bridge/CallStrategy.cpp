/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "CallStrategy.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    CallOutcome BlockingCallStrategy::call(const std::string&, const std::string& body) {
        return _client.roundTrip(body);
    }

    SuspendingCallStrategy::SuspendingCallStrategy(ChannelClient& client,
                                                   std::chrono::milliseconds completionTtl,
                                                   size_t maxUnclaimed)
        : _client(client)
        , _completionTtl(completionTtl)
        , _maxUnclaimed(maxUnclaimed) {
        _pumpThread = std::jthread([this](const std::stop_token& token) {
            FLOW_PROFILE_THREAD_NAME("FlowBridgePump");
            pumpLoop(token);
        });
    }

    SuspendingCallStrategy::~SuspendingCallStrategy() {
        _pumpThread.request_stop();
        _jobsCV.notify_all();
        if (_pumpThread.joinable()) {
            _pumpThread.join();
        }
    }

    CallOutcome SuspendingCallStrategy::call(const std::string& key, const std::string& body) {
        PendingCallPtr pending;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            pruneCompleted(std::chrono::steady_clock::now());

            auto done = _completed.find(key);
            if (done != _completed.end()) {
                Completion completion = std::move(done->second);
                _completed.erase(done);
                if (completion.error) {
                    std::rethrow_exception(completion.error);
                }
                return std::move(completion.reply);
            }

            auto flying = _inFlight.find(key);
            if (flying != _inFlight.end()) {
                return flying->second;
            }

            pending = std::make_shared<PendingCall>(key);
            _inFlight.emplace(key, pending);
            _jobs.push_back(Job{key, body});
        }
        _jobsCV.notify_one();
        return pending;
    }

    size_t SuspendingCallStrategy::inFlightCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _inFlight.size();
    }

    size_t SuspendingCallStrategy::unclaimedCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _completed.size();
    }

    void SuspendingCallStrategy::pruneCompleted(std::chrono::steady_clock::time_point now) {
        size_t expired = std::erase_if(_completed, [&](const auto& entry) {
            return now - entry.second.finishedAt >= _completionTtl;
        });

        while (_completed.size() > _maxUnclaimed) {
            auto oldest = std::min_element(_completed.begin(), _completed.end(), [](const auto& a, const auto& b) {
                return a.second.finishedAt < b.second.finishedAt;
            });
            _completed.erase(oldest);
            ++expired;
        }

        if (expired > 0) {
            FLOW_LOG_DEBUG_CAT("Bridge", std::format("Dropped {} uncollected async replies", expired));
        }
    }

    void SuspendingCallStrategy::pumpLoop(const std::stop_token& token) {
        while (!token.stop_requested()) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                if (!_jobsCV.wait(lock, token, [this]() { return !_jobs.empty(); })) {
                    break;
                }
                job = std::move(_jobs.front());
                _jobs.pop_front();
            }

            Completion completion;
            try {
                completion.reply = _client.roundTrip(job.body);
            } catch (const std::exception& e) {
                FLOW_LOG_DEBUG_CAT("Bridge", std::format("Async call '{}' failed: {}", job.key, e.what()));
                completion.error = std::current_exception();
            }

            auto finishedAt = std::chrono::steady_clock::now();
            completion.finishedAt = finishedAt;

            PendingCallPtr pending;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _completed[job.key] = std::move(completion);
                pruneCompleted(finishedAt);
                auto it = _inFlight.find(job.key);
                if (it != _inFlight.end()) {
                    pending = std::move(it->second);
                    _inFlight.erase(it);
                }
            }
            if (pending) {
                pending->resolve();
            }
        }
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
