/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file WorkflowEngine.h
 * @brief Owner of workflow instances and the services they share
 *
 * One engine per process side. It holds the reactive store reference, the
 * event bus, the retry timer, the snapshot codec and, in the local domain, the
 * bridge that carries Remote steps across. The same type runs on the remote
 * side too: a host there forwards bridge request bodies to serveRemote(),
 * which runs the named step's effect in-process and answers with its output
 * and logs.
 */

#pragma once

#include "../Bridge/CrossDomainBridge.h"
#include "../Bridge/IRemoteTransport.h"
#include "../Store/IReactiveStore.h"
#include "../Store/ISnapshotCodec.h"
#include "../Store/JsonSnapshotCodec.h"
#include "EngineConfig.h"
#include "TimerService.h"
#include "Workflow.h"
#include "WorkflowEvents.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    /**
     * @brief Replaceable collaborators of an engine
     *
     * Leave transport empty for an engine that never leaves the process:
     * Remote steps then run in-process as fallbacks. A null codec makes
     * Workflow::serialize() throw SerializationUnsupported.
     */
    struct EngineServices {
        Bridge::RemoteTransportPtr transport;
        TimerServicePtr timer;      ///< ThreadTimerService when empty
        Store::SnapshotCodecPtr codec = std::make_shared<Store::JsonSnapshotCodec>();
    };

    /**
     * @brief Creates workflows and connects them to the store, bus, timer and bridge
     *
     * The store must outlive the engine, and the engine must outlive every
     * workflow it created.
     *
     * @code
     * Store::MemoryStore store;
     * EngineServices services;
     * services.transport = std::make_shared<Bridge::InProcessTransport>(
     *     [&remoteEngine](const std::string& body) { return remoteEngine.serveRemote(body); });
     * WorkflowEngine engine(store, {}, services);
     *
     * engine.on(Events::WorkflowErrorTopic, [](const WorkflowEvent& e) {
     *     std::cerr << e.instanceId << ": " << e.error << "\n";
     * });
     * auto wf = engine.createWorkflow("checkout");
     * @endcode
     */
    class WorkflowEngine {
    public:
        using HandlerId = WorkflowEventBus::HandlerId;
        using EventHandler = WorkflowEventBus::Handler;

        explicit WorkflowEngine(Store::IReactiveStore& store,
                                WorkflowEngineConfig config = {},
                                EngineServices services = {});
        ~WorkflowEngine();

        WorkflowEngine(const WorkflowEngine&) = delete;
        WorkflowEngine& operator=(const WorkflowEngine&) = delete;

        /**
         * @brief Creates a workflow with the engine's default config
         * @param id Instance id; "flow_<n>" when empty
         * @throws std::invalid_argument if the id is already taken
         */
        WorkflowPtr createWorkflow(const std::string& id = {});
        WorkflowPtr createWorkflow(const std::string& id, WorkflowConfig config);

        WorkflowPtr findWorkflow(const std::string& id) const;

        /// Drops the engine's reference; the instance lives on while callers hold it
        bool removeWorkflow(const std::string& id);

        std::vector<std::string> workflowIds() const;

        /// Subscribes to events of every instance
        HandlerId on(const std::string& topic, EventHandler handler);
        bool off(const std::string& topic, HandlerId id);

        /**
         * @brief Answers one bridge request in this process
         *
         * Runs the step's effect with ExecutionDomain::Remote and no downstream
         * scheduling. Never throws: an unknown instance or step, a malformed
         * body or a failing effect all come back as an error response.
         *
         * @param requestBody Encoded BridgeRequest
         * @return Encoded BridgeResponse
         */
        std::string serveRemote(const std::string& requestBody);

        Store::IReactiveStore& store() { return _store; }
        WorkflowEventBus& eventBus() { return *_eventBus; }
        std::weak_ptr<WorkflowEventBus> eventBusRef() const { return _eventBus; }

        /// The bridge, or nullptr when Remote steps run in-process
        Bridge::CrossDomainBridge* bridge() { return _bridge.get(); }
        ITimerService& timer() { return *_timer; }
        const Store::SnapshotCodecPtr& snapshotCodec() const { return _codec; }

        ExecutionDomain processDomain() const { return _config.processDomain; }
        const WorkflowEngineConfig& getConfig() const { return _config; }

    private:
        Store::IReactiveStore& _store;
        WorkflowEngineConfig _config;
        std::shared_ptr<WorkflowEventBus> _eventBus;
        TimerServicePtr _timer;
        Store::SnapshotCodecPtr _codec;
        std::unique_ptr<Bridge::CrossDomainBridge> _bridge;

        mutable std::mutex _mutex;
        std::unordered_map<std::string, WorkflowPtr> _workflows;
        uint64_t _nextAutoId = 1;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
