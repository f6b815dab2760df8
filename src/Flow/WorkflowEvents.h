/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file WorkflowEvents.h
 * @brief Lifecycle notifications published on the engine's event bus
 *
 * Instance topics: workflow:start, workflow:idle, workflow:finish, workflow:error.
 *
 * Step topics are published twice, once under the bare name and once with the
 * step name appended, so an observer can follow every step or just one:
 *
 *   step:before  step:before:<name>
 *   step:after   step:after:<name>
 *   step:error   step:error:<name>
 *   step:suspended  step:suspended:<name>
 *
 * @code
 * engine.on(Events::StepError, [](const WorkflowEvent& e) {
 *     std::cerr << e.instanceId << "/" << e.stepName << ": " << e.error << "\n";
 * });
 * workflow->on(Events::stepAfter("charge"), [](const WorkflowEvent& e) {
 *     receipt(e.output);
 * });
 * @endcode
 */

#pragma once

#include "../Core/EventBus.h"
#include "../Core/Value.h"
#include <cstdint>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Flow {

    struct WorkflowEvent {
        std::string topic;
        std::string instanceId;
        std::string stepName;       ///< Empty for workflow:* topics
        std::string traceId;
        Value input;
        Value output;               ///< step:after only
        std::string error;          ///< step:error and workflow:error only
        uint32_t attempt = 0;
        int64_t timestampMs = 0;
    };

    using WorkflowEventBus = EventBus<WorkflowEvent>;

    namespace Events {
        inline constexpr const char* WorkflowStart = "workflow:start";
        inline constexpr const char* WorkflowIdle = "workflow:idle";
        inline constexpr const char* WorkflowFinish = "workflow:finish";
        inline constexpr const char* WorkflowErrorTopic = "workflow:error";

        inline constexpr const char* StepBefore = "step:before";
        inline constexpr const char* StepAfter = "step:after";
        inline constexpr const char* StepError = "step:error";
        inline constexpr const char* StepSuspended = "step:suspended";

        inline std::string forStep(const char* topic, const std::string& stepName) {
            return std::string(topic) + ":" + stepName;
        }

        inline std::string stepBefore(const std::string& stepName) { return forStep(StepBefore, stepName); }
        inline std::string stepAfter(const std::string& stepName) { return forStep(StepAfter, stepName); }
        inline std::string stepError(const std::string& stepName) { return forStep(StepError, stepName); }
        inline std::string stepSuspended(const std::string& stepName) { return forStep(StepSuspended, stepName); }
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
