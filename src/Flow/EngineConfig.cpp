/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "EngineConfig.h"
#include <format>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Flow {

namespace {

    using nlohmann::json;

    template<typename Enum>
    Enum parseEnumKey(const json& object, const char* key, Enum fallback,
                      std::optional<Enum> (*parse)(std::string_view)) {
        auto it = object.find(key);
        if (it == object.end()) return fallback;
        if (!it->is_string()) {
            throw std::invalid_argument(std::format("Engine config: '{}' must be a string", key));
        }
        auto text = it->get<std::string>();
        auto parsed = parse(text);
        if (!parsed) {
            throw std::invalid_argument(std::format("Engine config: unknown {} '{}'", key, text));
        }
        return *parsed;
    }

    uint64_t readUnsigned(const json& object, const char* key, uint64_t fallback) {
        auto it = object.find(key);
        if (it == object.end()) return fallback;
        if (it->is_number_unsigned()) return it->get<uint64_t>();
        if (it->is_number_integer() && it->get<int64_t>() >= 0) return static_cast<uint64_t>(it->get<int64_t>());
        throw std::invalid_argument(std::format("Engine config: '{}' must be a non-negative integer", key));
    }

    bool readBool(const json& object, const char* key, bool fallback) {
        auto it = object.find(key);
        if (it == object.end()) return fallback;
        if (!it->is_boolean()) {
            throw std::invalid_argument(std::format("Engine config: '{}' must be a boolean", key));
        }
        return it->get<bool>();
    }

    const json* readObject(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end()) return nullptr;
        if (!it->is_object()) {
            throw std::invalid_argument(std::format("Engine config: '{}' must be an object", key));
        }
        return &*it;
    }

    void readBridge(const json& object, Bridge::BridgeConfig& bridge) {
        if (auto it = object.find("targetUrl"); it != object.end()) {
            if (!it->is_string()) {
                throw std::invalid_argument("Engine config: 'bridge.targetUrl' must be a string");
            }
            bridge.targetUrl = it->get<std::string>();
        }
        if (const json* headers = readObject(object, "headers")) {
            bridge.headers.clear();
            for (const auto& [name, value] : headers->items()) {
                if (!value.is_string()) {
                    throw std::invalid_argument(std::format("Engine config: header '{}' must be a string", name));
                }
                bridge.headers[name] = value.get<std::string>();
            }
        }
        bridge.timeout = std::chrono::milliseconds(
            readUnsigned(object, "timeoutMs", static_cast<uint64_t>(bridge.timeout.count())));
        auto capacity = readUnsigned(object, "channelCapacity", bridge.channelCapacity);
        if (capacity == 0 || capacity > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw std::invalid_argument(std::format("Engine config: channelCapacity {} out of range", capacity));
        }
        bridge.channelCapacity = static_cast<size_t>(capacity);
        bridge.callerMayBlock = readBool(object, "callerMayBlock", bridge.callerMayBlock);

        auto ttl = readUnsigned(object, "completionTtlMs", static_cast<uint64_t>(bridge.completionTtl.count()));
        auto unclaimed = readUnsigned(object, "maxUnclaimedCompletions", bridge.maxUnclaimedCompletions);
        if (ttl == 0 || unclaimed == 0) {
            throw std::invalid_argument("Engine config: completionTtlMs and maxUnclaimedCompletions must be positive");
        }
        bridge.completionTtl = std::chrono::milliseconds(ttl);
        bridge.maxUnclaimedCompletions = static_cast<size_t>(unclaimed);
    }

} // namespace

WorkflowEngineConfig parseEngineConfig(std::string_view text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::format("Engine config is not valid JSON: {}", e.what()));
    }
    if (!root.is_object()) {
        throw std::invalid_argument("Engine config must be a JSON object");
    }

    WorkflowEngineConfig config;
    auto& defaults = config.defaults;

    defaults.order = parseEnumKey(root, "order", defaults.order, &parseQueueOrder);
    defaults.resumeMode = parseEnumKey(root, "resumeMode", defaults.resumeMode, &parseResumeMode);
    defaults.logSize = static_cast<size_t>(readUnsigned(root, "logSize", defaults.logSize));
    if (defaults.logSize == 0) {
        throw std::invalid_argument("Engine config: 'logSize' must be at least 1");
    }
    defaults.enableDebugLogging = readBool(root, "enableDebugLogging", defaults.enableDebugLogging);

    if (const json* budgets = readObject(root, "budgets")) {
        defaults.budgets.maxSteps = readUnsigned(*budgets, "maxSteps", defaults.budgets.maxSteps);
        defaults.budgets.maxMillis = readUnsigned(*budgets, "maxMillis", defaults.budgets.maxMillis);
    }

    config.processDomain = parseEnumKey(root, "processDomain", config.processDomain, &parseExecutionDomain);
    if (config.processDomain == ExecutionDomain::Both) {
        throw std::invalid_argument("Engine config: processDomain must be 'local' or 'remote'");
    }
    config.enableBridge = readBool(root, "enableBridge", config.enableBridge);

    if (const json* bridge = readObject(root, "bridge")) {
        readBridge(*bridge, config.bridge);
    }

    if (auto it = root.find("logLevel"); it != root.end()) {
        if (!it->is_string()) {
            throw std::invalid_argument("Engine config: 'logLevel' must be a string");
        }
        config.logLevel = Logging::stringToLogLevel(it->get<std::string>());
    }

    return config;
}

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
