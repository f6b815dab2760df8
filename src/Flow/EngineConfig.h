/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "../Bridge/CrossDomainBridge.h"
#include "../Logging/LogLevel.h"
#include "WorkflowTypes.h"
#include <optional>
#include <string_view>

namespace FlowEngine {
namespace Core {
namespace Flow {

    /**
     * @brief Engine-wide settings
     *
     * defaults applies to every workflow created without its own config.
     * processDomain says which side of the bridge this engine lives on: an
     * engine in the Remote domain runs every effect in-process and never
     * builds a bridge of its own.
     */
    struct WorkflowEngineConfig {
        WorkflowConfig defaults;
        ExecutionDomain processDomain = ExecutionDomain::Local;
        bool enableBridge = true;
        Bridge::BridgeConfig bridge;
        std::optional<Logging::LogLevel> logLevel;   ///< Applied to the global logger by the engine when set
    };

    /**
     * @brief Reads an engine config from JSON text
     *
     * Every key is optional; missing keys keep their defaults.
     *
     * @code
     * {
     *   "processDomain": "local",
     *   "enableBridge": true,
     *   "logLevel": "debug",
     *   "order": "lifo",
     *   "budgets": {"maxSteps": 500, "maxMillis": 0},
     *   "logSize": 64,
     *   "resumeMode": "auto",
     *   "enableDebugLogging": false,
     *   "bridge": {
     *     "targetUrl": "fx://remote/flowStep",
     *     "headers": {"content-type": "application/json"},
     *     "timeoutMs": 15000,
     *     "channelCapacity": 2097144,
     *     "callerMayBlock": true,
     *     "completionTtlMs": 60000,
     *     "maxUnclaimedCompletions": 256
     *   }
     * }
     * @endcode
     *
     * The workflow keys (order, budgets, logSize, resumeMode,
     * enableDebugLogging) fill WorkflowEngineConfig::defaults. An unknown
     * logLevel name reads as Info, as stringToLogLevel() does.
     *
     * @throws std::invalid_argument on malformed JSON, a wrong value type or an unknown enum name
     */
    WorkflowEngineConfig parseEngineConfig(std::string_view text);

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
