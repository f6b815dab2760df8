/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "CrossDomainBridge.h"
#include "../Core/WorkflowErrors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <format>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    CrossDomainBridge::CrossDomainBridge(BridgeConfig config, RemoteTransportPtr transport)
        : _config(std::move(config)) {
        if (!transport) {
            throw std::invalid_argument("CrossDomainBridge requires a transport");
        }

        // std::map keeps the headers sorted, so the key text is stable
        nlohmann::json headers = nlohmann::json::object();
        for (const auto& [name, value] : _config.headers) {
            headers[name] = value;
        }
        _headersKey = headers.dump();

        _client = std::make_unique<ChannelClient>(_config.channelCapacity,
                                                  _config.timeout,
                                                  std::move(transport),
                                                  _config.targetUrl,
                                                  _config.headers);
        if (_config.callerMayBlock) {
            _strategy = std::make_unique<BlockingCallStrategy>(*_client);
        } else {
            _strategy = std::make_unique<SuspendingCallStrategy>(*_client, _config.completionTtl,
                                                                 _config.maxUnclaimedCompletions);
        }

        FLOW_LOG_DEBUG_CAT("Bridge", std::format("Bridge to '{}' ready ({} byte channel, {} strategy)",
            _config.targetUrl, _config.channelCapacity, _config.callerMayBlock ? "blocking" : "suspending"));
    }

    CrossDomainBridge::~CrossDomainBridge() {
        // The strategy refers to the client
        _strategy.reset();
        _client.reset();
    }

    std::string CrossDomainBridge::cacheKey(const std::string& body) const {
        return std::format("{}|{}|{}", _config.targetUrl, body, _headersKey);
    }

    BridgeOutcome CrossDomainBridge::call(const BridgeRequest& request) {
        FLOW_PROFILE_ZONE_NC("CrossDomainBridge::call", Debug::ProfileColors::Bridge);
        _stats.calls.fetch_add(1, std::memory_order_relaxed);

        std::string body = encodeRequest(request);
        std::string key = cacheKey(body);

        {
            std::lock_guard<std::mutex> lock(_cacheMutex);
            auto it = _cache.find(key);
            if (it != _cache.end()) {
                _stats.cacheHits.fetch_add(1, std::memory_order_relaxed);
                return it->second;
            }
        }

        CallOutcome outcome;
        try {
            outcome = _strategy->call(key, body);
        } catch (const BridgeError&) {
            _stats.failures.fetch_add(1, std::memory_order_relaxed);
            throw;
        }

        if (auto* pending = std::get_if<PendingCallPtr>(&outcome)) {
            _stats.suspensions.fetch_add(1, std::memory_order_relaxed);
            return *pending;
        }

        BridgeResponse response = decodeResponse(std::get<std::string>(outcome));
        if (response.ok) {
            std::lock_guard<std::mutex> lock(_cacheMutex);
            _cache.emplace(key, response);
        }
        return response;
    }

    size_t CrossDomainBridge::cacheSize() const {
        std::lock_guard<std::mutex> lock(_cacheMutex);
        return _cache.size();
    }

    void CrossDomainBridge::clearCache() {
        std::lock_guard<std::mutex> lock(_cacheMutex);
        _cache.clear();
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
