/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "RemoteWorker.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    RemoteWorker::RemoteWorker(SharedChannel& channel, RemoteTransportPtr transport, std::string targetUrl, Headers headers)
        : _channel(channel)
        , _transport(std::move(transport))
        , _targetUrl(std::move(targetUrl))
        , _headers(std::move(headers)) {
        if (!_transport) {
            throw std::invalid_argument("RemoteWorker requires a transport");
        }
    }

    RemoteWorker::~RemoteWorker() {
        stop();
    }

    void RemoteWorker::start() {
        if (_running) {
            return;
        }
        _thread = std::jthread([this](const std::stop_token& token) {
            FLOW_PROFILE_THREAD_NAME("FlowRemoteWorker");
            run(token);
        });
        _running = true;
    }

    void RemoteWorker::stop() {
        if (!_running) {
            return;
        }
        _thread.request_stop();
        _queueCV.notify_all();
        if (_thread.joinable()) {
            _thread.join();
        }
        _running = false;
    }

    void RemoteWorker::ring(int32_t requestId) {
        {
            std::lock_guard<std::mutex> lock(_queueMutex);
            _doorbell.push_back(requestId);
        }
        _queueCV.notify_one();
    }

    bool RemoteWorker::abandon(int32_t requestId) {
        std::lock_guard<std::mutex> lock(_replyMutex);
        if (_channel.load(SharedChannel::Word::Lock) != 0) {
            return false;
        }
        _abandoned.insert(requestId);
        return true;
    }

    void RemoteWorker::run(const std::stop_token& token) {
        while (!token.stop_requested()) {
            int32_t requestId = 0;
            {
                std::unique_lock<std::mutex> lock(_queueMutex);
                if (!_queueCV.wait(lock, token, [this]() { return !_doorbell.empty(); })) {
                    break;
                }
                requestId = _doorbell.front();
                _doorbell.pop_front();
            }
            serve(requestId);
        }
    }

    void RemoteWorker::serve(int32_t requestId) {
        FLOW_PROFILE_ZONE_NC("RemoteWorker::serve", Debug::ProfileColors::Remote);

        std::string body;
        {
            std::lock_guard<std::mutex> lock(_replyMutex);
            if (_abandoned.erase(requestId) > 0) {
                FLOW_LOG_DEBUG_CAT("RemoteWorker", std::format("Skipping abandoned request {}", requestId));
                return;
            }
            body = _channel.readPayload();
        }

        std::string reply;
        bool delivered = true;
        try {
            _transportCalls.fetch_add(1, std::memory_order_relaxed);
            reply = _transport->send(_targetUrl, body, _headers);
        } catch (const std::exception& e) {
            delivered = false;
            FLOW_LOG_WARNING_CAT("RemoteWorker",
                std::format("Transport failed for request {}: {}", requestId, e.what()));
        } catch (...) {
            delivered = false;
            FLOW_LOG_WARNING_CAT("RemoteWorker",
                std::format("Transport failed for request {} with a non-standard exception", requestId));
        }

        {
            std::lock_guard<std::mutex> lock(_replyMutex);
            if (_abandoned.erase(requestId) > 0) {
                FLOW_LOG_DEBUG_CAT("RemoteWorker", std::format("Discarding late reply for request {}", requestId));
                return;
            }

            if (!delivered) {
                _channel.store(SharedChannel::Word::Length, 0);
                _channel.store(SharedChannel::Word::Lock, -requestId);
            } else if (reply.size() > _channel.capacity()) {
                FLOW_LOG_WARNING_CAT("RemoteWorker",
                    std::format("Reply for request {} is {} bytes, channel holds {}", requestId, reply.size(), _channel.capacity()));
                _channel.store(SharedChannel::Word::Length, static_cast<int32_t>(std::min<size_t>(reply.size(), INT32_MAX)));
                _channel.store(SharedChannel::Word::Lock, -requestId);
            } else {
                _channel.writePayload(reply);
                _channel.store(SharedChannel::Word::Lock, requestId);
            }
        }
        _channel.notify(SharedChannel::Word::Lock);
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
