/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file StepContext.h
 * @brief What an effect, guard or branch sees while one step executes
 */

#pragma once

#include "StepLog.h"
#include "StepRegistry.h"
#include "WorkflowTypes.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Flow {

    class StepExecutor;
    class WorkflowEngine;

    /// Builds the steps of a sub-workflow
    using WorkflowBuilder = std::function<void(Workflow&)>;

    /// Where a spawned sub-workflow starts
    struct SubWorkflowStart {
        std::string stepName;
        Value payload;
    };

    /**
     * @brief Per-execution view of the workflow
     *
     * Built fresh for every attempt and never stored. Effects use it to read
     * their input, publish their own value, steer downstream steps and write
     * the step log.
     *
     * @code
     * def.effect = [](StepContext& ctx) -> Value {
     *     auto total = ctx.input().asInt() * 2;
     *     ctx.shared()["lastTotal"] = total;
     *     if (total > 100) {
     *         ctx.enqueueNext("review", total);
     *     }
     *     ctx.log("doubled", total);
     *     return total;
     * };
     * @endcode
     */
    class StepContext {
    public:
        StepContext(Workflow& workflow,
                    std::string stepName,
                    StepRegistry::DefinitionPtr definition,
                    Value input,
                    std::string traceId,
                    ExecutionDomain executionDomain,
                    uint32_t attempt);

        const Value& input() const { return _input; }
        const std::string& stepName() const { return _stepName; }
        const std::string& traceId() const { return _traceId; }
        uint32_t attempt() const { return _attempt; }

        /// The domain this execution actually runs in (matters for Both steps)
        ExecutionDomain executionDomain() const { return _executionDomain; }

        const std::string& instanceId() const;

        /**
         * @brief Writes this step's backing node in the store
         *
         * A changed value wakes the node's watcher, which enqueues this step
         * again with the new value. An equal value changes nothing, which is
         * how a step that reaches a fixed point stops re-triggering itself.
         *
         * @return true if the stored value changed
         */
        bool writeSelf(Value value);

        /// Queues a downstream step; it runs in a later iteration of the pump
        void enqueueNext(const std::string& stepName, Value payload = Value());

        /// True once enqueueNext() was called during this execution
        bool enqueuedAny() const { return _enqueuedAny; }

        /**
         * @brief Creates (or reuses) a child workflow and builds it
         *
         * The child id is "<this id>.subflows.<name>". When start is given the
         * child is started right away; it pumps independently of this one.
         */
        std::shared_ptr<Workflow> spawnSubWorkflow(const std::string& name,
                                                   const WorkflowBuilder& builder,
                                                   std::optional<SubWorkflowStart> start = std::nullopt);

        /// Like spawnSubWorkflow() without starting anything
        std::shared_ptr<Workflow> planSubWorkflow(const std::string& name, const WorkflowBuilder& builder);

        /// Instance-wide scratch map; steps of one instance never run concurrently
        Value::Object& shared();

        /// {"hasEffect", "hasBranch", "hasGuard"} of the current definition
        Value meta() const;

        template<typename... Args>
        void log(Args&&... args) {
            append(StepLogLevel::Info, Value::Array{Value(std::forward<Args>(args))...});
        }

        template<typename... Args>
        void warn(Args&&... args) {
            append(StepLogLevel::Warn, Value::Array{Value(std::forward<Args>(args))...});
        }

        template<typename... Args>
        void error(Args&&... args) {
            append(StepLogLevel::Error, Value::Array{Value(std::forward<Args>(args))...});
        }

        /// Entries this context appended, as {ts, level, args} values
        const Value::Array& emittedLogs() const { return _emittedLogs; }

    private:
        friend class StepExecutor;
        friend class WorkflowEngine;

        void append(StepLogLevel level, Value::Array args);

        Workflow& _workflow;
        std::string _stepName;
        StepRegistry::DefinitionPtr _definition;
        Value _input;
        std::string _traceId;
        ExecutionDomain _executionDomain;
        uint32_t _attempt;

        bool _enqueuedAny = false;
        bool _detached = false;     ///< Serving a bridge request: downstream enqueues are dropped
        Value::Array _emittedLogs;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
