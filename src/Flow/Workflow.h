/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file Workflow.h
 * @brief One running graph of named steps
 *
 * A Workflow is a set of step definitions wired by edges, a work queue, and
 * the per-instance state steps share. Calling start() enqueues the first step
 * and pumps: the pump drains the queue one step at a time through the
 * StepExecutor, and every step can enqueue more work (explicitly, through its
 * branch, or through its static next list) until the queue is empty or the
 * pump's budget runs out.
 *
 * Each step also has a backing node in the reactive store. Writing that node
 * with a different value (from outside via set(), or from the step itself via
 * StepContext::writeSelf()) enqueues the step with the new value and pumps.
 */

#pragma once

#include "../Store/IReactiveStore.h"
#include "StepContext.h"
#include "StepExecutor.h"
#include "StepLog.h"
#include "StepRegistry.h"
#include "WorkflowEvents.h"
#include "WorkflowScheduler.h"
#include "WorkflowTypes.h"
#include <atomic>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    class WorkflowEngine;

    /**
     * @brief A workflow instance
     *
     * Instances are created by WorkflowEngine::createWorkflow() and shared via
     * std::shared_ptr; the engine must outlive them. Pump calls on one instance
     * are serialized by a reentrancy flag: a pump() issued while another is in
     * progress (from a step's own watcher, or from another thread) returns at
     * once and the running pump picks up the new work. Different instances can
     * be pumped from different threads concurrently.
     *
     * Failures never escape pump(). They surface as step:error / workflow:error
     * events and step log entries.
     *
     * @code
     * Store::MemoryStore store;
     * WorkflowEngine engine(store);
     * auto wf = engine.createWorkflow("pricing");
     *
     * StepDefinition a;
     * a.effect = [](StepContext& ctx) { return ctx.input().asInt() * 2; };
     * a.staticNext = {"B"};
     * wf->defineStep("A", a);
     *
     * StepDefinition b;
     * b.effect = [](StepContext& ctx) { return ctx.input().asInt() + 1; };
     * wf->defineStep("B", b);
     *
     * wf->on(Events::StepAfter, [](const WorkflowEvent& e) {
     *     std::cout << e.stepName << " -> " << toJsonString(e.output) << "\n";
     * });
     * wf->start("A", 3);          // A -> 6, B -> 7
     * @endcode
     */
    class Workflow : public std::enable_shared_from_this<Workflow> {
    public:
        using HandlerId = WorkflowEventBus::HandlerId;
        using EventHandler = WorkflowEventBus::Handler;
        using Unsubscribe = std::function<void()>;

        Workflow(WorkflowEngine& engine, std::string id, WorkflowConfig config);
        ~Workflow();

        Workflow(const Workflow&) = delete;
        Workflow& operator=(const Workflow&) = delete;

        const std::string& id() const { return _id; }
        const WorkflowConfig& config() const { return _config; }
        WorkflowEngine& engine() { return _engine; }

        /**
         * @brief Adds or replaces a step
         *
         * Queued items keep their step name and run with whatever definition is
         * current when they are dequeued.
         *
         * @throws std::invalid_argument for an empty name or an inconsistent definition
         */
        Workflow& defineStep(const std::string& name, StepDefinition definition);

        bool hasStep(const std::string& name) const { return _registry.contains(name); }
        StepRegistry::DefinitionPtr findStep(const std::string& name) const { return _registry.find(name); }

        /// Appends static edges from -> to; they fire when a step enqueues nothing itself
        Workflow& connect(const std::string& from, const std::vector<std::string>& to);
        Workflow& connect(const std::string& from, std::initializer_list<std::string> to) {
            return connect(from, std::vector<std::string>(to));
        }
        Workflow& connect(const std::string& from, const std::string& to) {
            return connect(from, std::vector<std::string>{to});
        }

        std::vector<std::string> edges(const std::string& from) const { return _registry.edges(from); }

        /**
         * @brief Enqueues a step and pumps
         * @throws std::invalid_argument if the step is not defined
         */
        void start(const std::string& stepName, Value payload = Value());

        /**
         * @brief Appends a queue item without pumping
         * @param traceId Correlation token; generated when empty
         * @return The trace id the item carries
         */
        std::string enqueue(const std::string& stepName, Value payload = Value(), std::string traceId = {});

        /**
         * @brief Drains the queue until it is empty or the budget runs out
         *
         * Emits workflow:start on entry and workflow:idle when the queue is
         * empty on exit; workflow:finish follows idle when no retry is waiting
         * and no step is suspended. A call made while a pump is in progress
         * does nothing.
         *
         * @return Number of items executed by this call
         */
        size_t pump();

        /// Resets stats.steps to 0 and pumps
        size_t runSync();

        /// Writes a step's backing node, as StepContext::writeSelf() does
        bool set(const std::string& stepName, Value value);

        /// Current value of a step's backing node
        Value value(const std::string& stepName) const;

        /// Last committed output of a step (null if it never succeeded)
        Value output(const std::string& stepName) const;

        /**
         * @brief Subscribes to this instance's events
         * @return Callable that removes the subscription
         */
        Unsubscribe on(const std::string& topic, EventHandler handler);
        HandlerId subscribe(const std::string& topic, EventHandler handler);
        bool off(const std::string& topic, HandlerId id);

        /**
         * @brief Portable snapshot of queue, stats, shared map, edges and logs
         *
         * Step definitions are written as metadata only.
         *
         * @throws SerializationUnsupported if the engine has no snapshot codec
         */
        std::string serialize() const;

        /**
         * @brief Restores state written by serialize()
         *
         * Steps missing locally are created without code so the structure is
         * complete; re-attaching effects is up to the caller.
         *
         * @throws SerializationUnsupported if the engine has no snapshot codec
         * @throws std::invalid_argument if the text is not a workflow snapshot
         */
        void deserialize(const std::string& text);

        Value toSnapshotValue() const;
        void restoreSnapshotValue(const Value& snapshot);

        /// Scratch map visible to every step of this instance
        Value::Object& shared() { return _shared; }
        const Value::Object& shared() const { return _shared; }

        StepLog& logs() { return _logs; }
        const StepLog& logs() const { return _logs; }

        WorkflowStats::Snapshot getStats() const { return _stats.toSnapshot(); }

        size_t queueSize() const { return _scheduler.queueSize(); }
        std::vector<QueueItem> queueSnapshot() const { return _scheduler.queueSnapshot(); }
        bool isRunning() const { return _scheduler.isRunning(); }

        /// Retries waiting for their backoff timer
        size_t pendingRetries() const { return _pendingRetries.load(); }

        /// Attempts waiting on a bridge call
        size_t suspendedCount() const { return _suspended.load(); }

        /// Store path of a step's backing node
        std::string nodePath(const std::string& stepName) const;
        std::string outputPath(const std::string& stepName) const;

    private:
        friend class StepExecutor;
        friend class StepContext;

        void emit(const std::string& topic, WorkflowEvent event);
        void emitStep(const char* topic, const std::string& stepName, WorkflowEvent event);

        void ensureWatcher(const std::string& stepName);
        void commitOutput(const std::string& stepName, const Value& output);
        std::string nextTraceId();

        /// Delivers an item from another thread and pumps if resumeMode is Auto
        void deliver(QueueItem item);
        void scheduleRetry(QueueItem item, std::chrono::milliseconds delay);
        void suspend(QueueItem item, const Bridge::PendingCallPtr& pending);

        bool finished() const;

        WorkflowEngine& _engine;
        std::string _id;
        WorkflowConfig _config;

        StepRegistry _registry;
        WorkflowScheduler _scheduler;
        StepExecutor _executor;
        StepLog _logs;
        WorkflowStats _stats;
        Value::Object _shared;

        mutable std::mutex _watchMutex;
        std::map<std::string, Store::WatchId> _watchers;

        std::atomic<size_t> _pendingRetries{0};
        std::atomic<size_t> _suspended{0};

        std::mutex _traceMutex;
        std::mt19937_64 _traceRng;
        uint64_t _traceCounter = 0;
    };

    using WorkflowPtr = std::shared_ptr<Workflow>;

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
