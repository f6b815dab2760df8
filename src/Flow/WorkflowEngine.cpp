/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "WorkflowEngine.h"
#include "../Bridge/BridgeMessages.h"
#include "../Core/WorkflowErrors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Flow {

    WorkflowEngine::WorkflowEngine(Store::IReactiveStore& store, WorkflowEngineConfig config, EngineServices services)
        : _store(store)
        , _config(std::move(config))
        , _eventBus(std::make_shared<WorkflowEventBus>())
        , _timer(std::move(services.timer))
        , _codec(std::move(services.codec)) {
        if (_config.logLevel) {
            Logging::Logger::global().setMinLevel(*_config.logLevel);
        }

        if (!_timer) {
            _timer = std::make_shared<ThreadTimerService>();
        }

        if (_config.processDomain == ExecutionDomain::Both) {
            throw std::invalid_argument("An engine runs in the local or the remote domain, not both");
        }

        if (_config.processDomain == ExecutionDomain::Local && _config.enableBridge) {
            if (services.transport) {
                try {
                    _bridge = std::make_unique<Bridge::CrossDomainBridge>(_config.bridge, std::move(services.transport));
                } catch (const std::exception& e) {
                    FLOW_LOG_WARNING_CAT("Bridge", std::format(
                        "Bridge unavailable, remote steps will run in-process: {}", e.what()));
                }
            } else {
                FLOW_LOG_INFO_CAT("Bridge", "No transport configured, remote steps will run in-process");
            }
        }

        FLOW_LOG_INFO_CAT("Engine", std::format("Workflow engine ready ({} domain, bridge {})",
            toString(_config.processDomain), _bridge ? "on" : "off"));
    }

    WorkflowEngine::~WorkflowEngine() {
        // Bridge and timer threads can deliver into workflows; stop them before the map goes
        _bridge.reset();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _workflows.clear();
        }
        _timer.reset();
    }

    WorkflowPtr WorkflowEngine::createWorkflow(const std::string& id) {
        return createWorkflow(id, _config.defaults);
    }

    WorkflowPtr WorkflowEngine::createWorkflow(const std::string& id, WorkflowConfig config) {
        if (config.logSize == 0) {
            throw std::invalid_argument("WorkflowConfig::logSize must be at least 1");
        }

        std::lock_guard<std::mutex> lock(_mutex);
        std::string instanceId = id;
        if (instanceId.empty()) {
            do {
                instanceId = std::format("flow_{}", _nextAutoId++);
            } while (_workflows.contains(instanceId));
        } else if (_workflows.contains(instanceId)) {
            throw std::invalid_argument(std::format("Workflow '{}' already exists", instanceId));
        }

        auto workflow = std::make_shared<Workflow>(*this, instanceId, config);
        _workflows.emplace(instanceId, workflow);
        FLOW_LOG_DEBUG_CAT("Engine", std::format("Created workflow '{}'", instanceId));
        return workflow;
    }

    WorkflowPtr WorkflowEngine::findWorkflow(const std::string& id) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _workflows.find(id);
        return it == _workflows.end() ? nullptr : it->second;
    }

    bool WorkflowEngine::removeWorkflow(const std::string& id) {
        WorkflowPtr removed;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _workflows.find(id);
            if (it == _workflows.end()) {
                return false;
            }
            removed = std::move(it->second);
            _workflows.erase(it);
        }
        // The last reference may go here, outside the lock, which unwatches its store nodes
        return true;
    }

    std::vector<std::string> WorkflowEngine::workflowIds() const {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ids.reserve(_workflows.size());
            for (const auto& [id, workflow] : _workflows) {
                ids.push_back(id);
            }
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    WorkflowEngine::HandlerId WorkflowEngine::on(const std::string& topic, EventHandler handler) {
        return _eventBus->subscribe(topic, std::move(handler));
    }

    bool WorkflowEngine::off(const std::string& topic, HandlerId id) {
        return _eventBus->unsubscribe(topic, id);
    }

    std::string WorkflowEngine::serveRemote(const std::string& requestBody) {
        FLOW_PROFILE_ZONE_NC("WorkflowEngine::serveRemote", Debug::ProfileColors::Remote);

        Bridge::BridgeRequest request;
        try {
            request = Bridge::decodeRequest(requestBody);
        } catch (const BridgeProtocolError& e) {
            FLOW_LOG_WARNING_CAT("Remote", std::format("Rejected bridge request: {}", e.what()));
            return Bridge::encodeResponse(Bridge::BridgeResponse::failure(e.what()));
        }

        auto workflow = findWorkflow(request.instanceId);
        if (!workflow) {
            return Bridge::encodeResponse(Bridge::BridgeResponse::failure(
                std::format("Unknown workflow '{}'", request.instanceId)));
        }
        auto definition = workflow->findStep(request.stepName);
        if (!definition) {
            return Bridge::encodeResponse(Bridge::BridgeResponse::failure(
                std::format("Unknown step '{}' in workflow '{}'", request.stepName, request.instanceId)));
        }

        StepContext ctx(*workflow, request.stepName, definition, request.payload,
                        request.traceId, ExecutionDomain::Remote, 1);
        ctx._detached = true;

        try {
            Value output = definition->effect ? definition->effect(ctx) : request.payload;
            return Bridge::encodeResponse(Bridge::BridgeResponse::success(std::move(output), ctx.emittedLogs()));
        } catch (const std::exception& e) {
            FLOW_PROFILE_MESSAGE(request.stepName.c_str(), request.stepName.size());
            FLOW_LOG_DEBUG_TRACE("Remote", request.traceId, std::format("'{}' step '{}' failed remotely: {}",
                request.instanceId, request.stepName, e.what()));
            return Bridge::encodeResponse(Bridge::BridgeResponse::failure(e.what()));
        } catch (...) {
            FLOW_LOG_DEBUG_TRACE("Remote", request.traceId, std::format("'{}' step '{}' failed remotely with a non-standard exception",
                request.instanceId, request.stepName));
            return Bridge::encodeResponse(Bridge::BridgeResponse::failure("non-standard exception"));
        }
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
