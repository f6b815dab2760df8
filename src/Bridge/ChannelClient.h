/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "RemoteWorker.h"
#include "SharedChannel.h"
#include <chrono>
#include <mutex>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /**
     * @brief Caller side of the shared channel protocol
     *
     * Owns the channel and the worker that answers on it. roundTrip() is the
     * blocking primitive both call strategies are built on: it takes the single
     * channel slot, frames the request, rings the worker and sleeps on the lock
     * word until the reply signal or the deadline.
     */
    class ChannelClient {
    public:
        ChannelClient(size_t capacity,
                      std::chrono::milliseconds timeout,
                      RemoteTransportPtr transport,
                      std::string targetUrl,
                      Headers headers);
        ~ChannelClient();

        ChannelClient(const ChannelClient&) = delete;
        ChannelClient& operator=(const ChannelClient&) = delete;

        /**
         * @brief Sends one request body and returns the reply body
         *
         * Concurrent callers queue on the channel slot.
         *
         * @throws BridgeBufferTooSmall if the request or the reply does not fit
         * @throws BridgeTimeout if no signal arrives before the timeout
         * @throws BridgeTransportError if the worker could not deliver the request
         * @throws BridgeProtocolError if the signal does not match the request id
         */
        std::string roundTrip(const std::string& body);

        size_t capacity() const { return _channel.capacity(); }
        std::chrono::milliseconds timeout() const { return _timeout; }
        uint64_t transportCalls() const { return _worker.transportCalls(); }

    private:
        int32_t nextRequestId();

        SharedChannel _channel;
        RemoteWorker _worker;
        std::chrono::milliseconds _timeout;

        std::mutex _slotMutex;
        int32_t _lastRequestId = 0;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
