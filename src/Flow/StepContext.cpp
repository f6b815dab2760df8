/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "StepContext.h"
#include "../Core/ValueJson.h"
#include "../Logging/Logger.h"
#include "Workflow.h"
#include "WorkflowEngine.h"
#include <format>

namespace FlowEngine {
namespace Core {
namespace Flow {

    StepContext::StepContext(Workflow& workflow,
                             std::string stepName,
                             StepRegistry::DefinitionPtr definition,
                             Value input,
                             std::string traceId,
                             ExecutionDomain executionDomain,
                             uint32_t attempt)
        : _workflow(workflow)
        , _stepName(std::move(stepName))
        , _definition(std::move(definition))
        , _input(std::move(input))
        , _traceId(std::move(traceId))
        , _executionDomain(executionDomain)
        , _attempt(attempt) {
    }

    const std::string& StepContext::instanceId() const {
        return _workflow.id();
    }

    bool StepContext::writeSelf(Value value) {
        return _workflow.set(_stepName, std::move(value));
    }

    void StepContext::enqueueNext(const std::string& stepName, Value payload) {
        if (_detached) {
            FLOW_LOG_DEBUG_CAT("Workflow", std::format(
                "'{}' enqueued '{}' while serving a remote call; dropped", _stepName, stepName));
            return;
        }
        _workflow.enqueue(stepName, std::move(payload), _traceId);
        _enqueuedAny = true;
    }

    std::shared_ptr<Workflow> StepContext::spawnSubWorkflow(const std::string& name,
                                                            const WorkflowBuilder& builder,
                                                            std::optional<SubWorkflowStart> start) {
        auto& engine = _workflow.engine();
        auto childId = std::format("{}.subflows.{}", _workflow.id(), name);

        auto child = engine.findWorkflow(childId);
        if (!child) {
            child = engine.createWorkflow(childId, _workflow.config());
        }
        if (builder) {
            builder(*child);
        }
        if (start) {
            child->start(start->stepName, std::move(start->payload));
        }
        return child;
    }

    std::shared_ptr<Workflow> StepContext::planSubWorkflow(const std::string& name, const WorkflowBuilder& builder) {
        return spawnSubWorkflow(name, builder, std::nullopt);
    }

    Value::Object& StepContext::shared() {
        return _workflow.shared();
    }

    Value StepContext::meta() const {
        if (!_definition) {
            return Value(Value::Object{});
        }
        return StepRegistry::metaOf(*_definition);
    }

    void StepContext::append(StepLogLevel level, Value::Array args) {
        if (_workflow.config().enableDebugLogging) {
            FLOW_LOG_DEBUG_CAT("Workflow", std::format("[{}/{}] {} {}",
                _workflow.id(), _stepName, toString(level), toJsonString(Value(args))));
        }
        auto entry = _workflow.logs().append(_stepName, level, std::move(args));
        _emittedLogs.push_back(entry.toValue());
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
