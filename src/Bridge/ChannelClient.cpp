/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "ChannelClient.h"
#include "../Core/WorkflowErrors.h"
#include "../Debug/Profiling.h"
#include <climits>
#include <format>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    ChannelClient::ChannelClient(size_t capacity,
                                 std::chrono::milliseconds timeout,
                                 RemoteTransportPtr transport,
                                 std::string targetUrl,
                                 Headers headers)
        : _channel(capacity)
        , _worker(_channel, std::move(transport), std::move(targetUrl), std::move(headers))
        , _timeout(timeout) {
        _worker.start();
    }

    ChannelClient::~ChannelClient() {
        _worker.stop();
    }

    int32_t ChannelClient::nextRequestId() {
        // Called with the slot held
        if (_lastRequestId == INT32_MAX) {
            _lastRequestId = 0;
        }
        return ++_lastRequestId;
    }

    std::string ChannelClient::roundTrip(const std::string& body) {
        FLOW_PROFILE_ZONE_NC("ChannelClient::roundTrip", Debug::ProfileColors::Bridge);

        std::lock_guard<std::mutex> slot(_slotMutex);

        int32_t requestId = nextRequestId();
        _channel.writePayload(body);
        _channel.store(SharedChannel::Word::Lock, 0);
        _worker.ring(requestId);

        auto deadline = std::chrono::steady_clock::now() + _timeout;
        int32_t signal = _channel.load(SharedChannel::Word::Lock);
        FLOW_PROFILE_ZONE_N("Bridge wait");
        while (signal == 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                if (!_worker.abandon(requestId)) {
                    signal = _channel.load(SharedChannel::Word::Lock);
                    break;
                }
                throw BridgeTimeout(std::format("No reply to request {} within {} ms", requestId, _timeout.count()));
            }
            _channel.wait(SharedChannel::Word::Lock, 0, remaining);
            signal = _channel.load(SharedChannel::Word::Lock);
        }

        if (signal == requestId) {
            return _channel.readPayload();
        }

        if (signal == -requestId) {
            int32_t length = _channel.load(SharedChannel::Word::Length);
            if (length > 0 && static_cast<size_t>(length) > _channel.capacity()) {
                throw BridgeBufferTooSmall(static_cast<size_t>(length), _channel.capacity());
            }
            throw BridgeTransportError(std::format("Remote worker could not deliver request {}", requestId));
        }

        throw BridgeProtocolError(std::format("Reply signal {} does not match request {}", signal, requestId));
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
