/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file CallStrategy.h
 * @brief How a bridge call waits for its reply
 *
 * Two implementations, chosen once from BridgeConfig::callerMayBlock:
 *
 * - BlockingCallStrategy runs the channel round trip on the calling thread.
 *   For worker threads that are allowed to sleep.
 * - SuspendingCallStrategy hands the round trip to a background pump thread
 *   and returns a PendingCall at once. The caller unwinds, and repeats the
 *   identical call after the PendingCall resolves to collect the outcome.
 */

#pragma once

#include "ChannelClient.h"
#include "PendingCall.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /// Reply body, or a handle to wait on
    using CallOutcome = std::variant<std::string, PendingCallPtr>;

    class ICallStrategy {
    public:
        virtual ~ICallStrategy() = default;

        /**
         * @brief Issues (or collects) the call identified by key
         * @throws BridgeError subclasses for failed round trips
         */
        virtual CallOutcome call(const std::string& key, const std::string& body) = 0;

        virtual bool mayBlock() const = 0;
    };

    class BlockingCallStrategy : public ICallStrategy {
    public:
        explicit BlockingCallStrategy(ChannelClient& client) : _client(client) {}

        CallOutcome call(const std::string& key, const std::string& body) override;
        bool mayBlock() const override { return true; }

    private:
        ChannelClient& _client;
    };

    /**
     * @brief Never blocks the caller
     *
     * The first call for a key queues the round trip and returns a PendingCall.
     * Further calls for the same key while it is in flight return the same
     * PendingCall. Once the round trip ends, the next call for the key returns
     * the reply body, or rethrows the failure exactly once.
     *
     * A reply nobody comes back for (its workflow was removed while suspended)
     * is dropped after completionTtl, and at most maxUnclaimed are kept. A
     * replay after that issues the round trip again.
     */
    class SuspendingCallStrategy : public ICallStrategy {
    public:
        SuspendingCallStrategy(ChannelClient& client,
                               std::chrono::milliseconds completionTtl,
                               size_t maxUnclaimed);
        ~SuspendingCallStrategy() override;

        CallOutcome call(const std::string& key, const std::string& body) override;
        bool mayBlock() const override { return false; }

        size_t inFlightCount() const;

        /// Finished calls whose outcome has not been collected yet
        size_t unclaimedCount() const;

    private:
        struct Job {
            std::string key;
            std::string body;
        };

        struct Completion {
            std::string reply;
            std::exception_ptr error;
            std::chrono::steady_clock::time_point finishedAt;
        };

        void pumpLoop(const std::stop_token& token);

        /// Drops expired completions, then the oldest ones over the cap. Caller holds _mutex.
        void pruneCompleted(std::chrono::steady_clock::time_point now);

        ChannelClient& _client;
        std::chrono::milliseconds _completionTtl;
        size_t _maxUnclaimed;

        mutable std::mutex _mutex;
        std::condition_variable_any _jobsCV;
        std::deque<Job> _jobs;
        std::unordered_map<std::string, PendingCallPtr> _inFlight;
        std::unordered_map<std::string, Completion> _completed;

        std::jthread _pumpThread;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
