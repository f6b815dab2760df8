/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "IRemoteTransport.h"
#include "SharedChannel.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_set>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /**
     * @brief Background thread answering requests placed in a SharedChannel
     *
     * ring(id) tells the worker a request with that id is in the channel. The
     * worker copies the request bytes, sends them through the transport, and
     * publishes the reply into the channel:
     *
     * - fits: payload + length, lock word = id
     * - too large: length word = required size, lock word = -id
     * - transport threw: length word = 0, lock word = -id
     *
     * then notifies the lock word. Requests the caller gave up on (abandon())
     * are skipped or their replies discarded, so a late reply can never land on
     * top of the next caller's request.
     */
    class RemoteWorker {
    public:
        /// @throws std::invalid_argument if transport is null
        RemoteWorker(SharedChannel& channel, RemoteTransportPtr transport, std::string targetUrl, Headers headers);
        ~RemoteWorker();

        RemoteWorker(const RemoteWorker&) = delete;
        RemoteWorker& operator=(const RemoteWorker&) = delete;

        void start();
        void stop();
        bool isRunning() const { return _running; }

        /// Queues a request id the worker should serve
        void ring(int32_t requestId);

        /**
         * @brief Gives up on a request so its reply will not be written
         * @return false if the reply was already published to the channel
         */
        bool abandon(int32_t requestId);

        /// Number of times the transport was invoked
        uint64_t transportCalls() const { return _transportCalls.load(std::memory_order_relaxed); }

    private:
        void run(const std::stop_token& token);
        void serve(int32_t requestId);

        SharedChannel& _channel;
        RemoteTransportPtr _transport;
        std::string _targetUrl;
        Headers _headers;

        std::jthread _thread;
        std::atomic<bool> _running = false;

        std::mutex _queueMutex;
        std::condition_variable_any _queueCV;
        std::deque<int32_t> _doorbell;

        std::mutex _replyMutex;                ///< Orders reply writes against abandon()
        std::unordered_set<int32_t> _abandoned;

        std::atomic<uint64_t> _transportCalls = 0;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
