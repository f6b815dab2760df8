/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file CrossDomainBridge.h
 * @brief Synchronous-looking step calls into the remote execution domain
 *
 * The bridge encodes a step request, pushes it through the shared channel to a
 * worker that owns the real transport, and hands back the decoded reply. Which
 * way the caller waits is decided once at construction by
 * BridgeConfig::callerMayBlock (see CallStrategy.h).
 *
 * Replies are cached by (targetUrl, request body, headers). A retried or
 * re-pumped step that produces the byte-identical request gets the cached
 * answer without a second transport call. The cache lives as long as the
 * bridge, which lives as long as the engine that created it.
 */

#pragma once

#include "../CoreCommon.h"
#include "BridgeMessages.h"
#include "CallStrategy.h"
#include "ChannelClient.h"
#include "IRemoteTransport.h"
#include "PendingCall.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    struct BridgeConfig {
        std::string targetUrl = "fx://remote/flowStep";                    ///< Passed to the transport with every request
        Headers headers = {{"content-type", "application/json"}};          ///< Passed to the transport, part of the cache key
        std::chrono::milliseconds timeout = std::chrono::milliseconds(15000); ///< Hard deadline for one round trip
        size_t channelCapacity = DefaultChannelCapacity;                   ///< Payload bytes the shared channel holds
        bool callerMayBlock = true;                                        ///< Blocking vs suspending call strategy
        std::chrono::milliseconds completionTtl = std::chrono::milliseconds(60000); ///< How long a suspended call's reply waits to be collected
        size_t maxUnclaimedCompletions = 256;                              ///< Oldest uncollected replies are dropped past this
    };

    struct BridgeStats {
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> cacheHits{0};
        std::atomic<uint64_t> suspensions{0};
        std::atomic<uint64_t> failures{0};

        struct Snapshot {
            uint64_t calls = 0;
            uint64_t cacheHits = 0;
            uint64_t suspensions = 0;
            uint64_t failures = 0;
        };

        Snapshot toSnapshot() const {
            Snapshot snap;
            snap.calls = calls.load(std::memory_order_relaxed);
            snap.cacheHits = cacheHits.load(std::memory_order_relaxed);
            snap.suspensions = suspensions.load(std::memory_order_relaxed);
            snap.failures = failures.load(std::memory_order_relaxed);
            return snap;
        }
    };

    /// Decoded reply, or a handle to wait on before repeating the call
    using BridgeOutcome = std::variant<BridgeResponse, PendingCallPtr>;

    /**
     * @brief The cross-domain call façade
     *
     * @code
     * BridgeConfig config;
     * config.timeout = std::chrono::milliseconds(2000);
     * CrossDomainBridge bridge(config, std::make_shared<InProcessTransport>(serve));
     *
     * auto outcome = bridge.call({"order-7", "charge", Value(1999), "t42"});
     * if (auto* response = std::get_if<BridgeResponse>(&outcome)) {
     *     if (response->ok) use(response->value);
     * }
     * @endcode
     */
    class CrossDomainBridge {
    public:
        /**
         * @throws std::invalid_argument if transport is null or the channel capacity is 0
         */
        CrossDomainBridge(BridgeConfig config, RemoteTransportPtr transport);
        ~CrossDomainBridge();

        CrossDomainBridge(const CrossDomainBridge&) = delete;
        CrossDomainBridge& operator=(const CrossDomainBridge&) = delete;

        /**
         * @brief Performs one step call
         *
         * A remote "err" reply is returned as a response with ok == false, not
         * thrown. Only ok replies are cached.
         *
         * @throws BridgeTimeout, BridgeTransportError, BridgeProtocolError, BridgeBufferTooSmall
         */
        BridgeOutcome call(const BridgeRequest& request);

        /// Cache key for an encoded request body
        std::string cacheKey(const std::string& body) const;

        bool callerMayBlock() const { return _strategy->mayBlock(); }
        const BridgeConfig& getConfig() const { return _config; }

        size_t cacheSize() const;
        void clearCache();

        uint64_t transportCalls() const { return _client->transportCalls(); }
        BridgeStats::Snapshot getStats() const { return _stats.toSnapshot(); }

    private:
        BridgeConfig _config;
        std::string _headersKey;

        std::unique_ptr<ChannelClient> _client;
        std::unique_ptr<ICallStrategy> _strategy;

        mutable std::mutex _cacheMutex;
        std::unordered_map<std::string, BridgeResponse> _cache;

        BridgeStats _stats;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
