/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file WorkflowTypes.h
 * @brief Vocabulary of the workflow engine: domains, step definitions, queue items, config and stats
 *
 * Kept apart from Workflow.h so the registry, executor and scheduler can share
 * these types without including each other.
 */

#pragma once

#include "../Bridge/PendingCall.h"
#include "../Core/Value.h"
#include "../CoreCommon.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    class StepContext;
    class Workflow;

    /**
     * @brief Where a step's effect runs
     *
     * @code
     * StepDefinition charge;
     * charge.executionDomain = ExecutionDomain::Remote;   // through the bridge
     * charge.effect = [](StepContext& ctx) { return chargeCard(ctx.input()); };
     * @endcode
     */
    enum class ExecutionDomain : uint8_t {
        Local = 0,   ///< In this process, on the pumping thread
        Remote = 1,  ///< In the remote domain, through the cross-domain bridge
        Both = 2     ///< Both sides, sequenced by BothModeOrder
    };

    /// Sequencing of the two sides of an ExecutionDomain::Both step
    enum class BothModeOrder : uint8_t {
        RemoteFirst = 0,
        LocalFirst = 1,
        Parallel = 2    ///< Remote call started first, local side runs while it is in flight
    };

    /// How outputs of the successful sides of a Both step become one output
    enum class MergeStrategy : uint8_t {
        Last = 0,    ///< Output of the side that completed last
        All = 1,     ///< Array of side outputs in completion order
        Reduce = 2   ///< Fold of the side outputs with StepDefinition::reducer
    };

    /// FIFO walks the graph breadth-first, LIFO depth-first
    enum class QueueOrder : uint8_t {
        Fifo = 0,
        Lifo = 1
    };

    /**
     * @brief Who pumps after a retry timer fires or a suspended call completes
     *
     * Auto pumps from the thread that delivered the continuation. Manual only
     * queues it; the host calls pump() itself, which is what a single-threaded
     * UI loop wants.
     */
    enum class ResumeMode : uint8_t {
        Auto = 0,
        Manual = 1
    };

    const char* toString(ExecutionDomain domain);
    const char* toString(BothModeOrder order);
    const char* toString(MergeStrategy merge);
    const char* toString(QueueOrder order);
    const char* toString(ResumeMode mode);

    std::optional<ExecutionDomain> parseExecutionDomain(std::string_view text);
    std::optional<BothModeOrder> parseBothModeOrder(std::string_view text);
    std::optional<MergeStrategy> parseMergeStrategy(std::string_view text);
    /// Accepts "fifo"/"bfs" and "lifo"/"dfs"
    std::optional<QueueOrder> parseQueueOrder(std::string_view text);
    std::optional<ResumeMode> parseResumeMode(std::string_view text);

    /**
     * @brief Retry policy for a failing effect
     *
     * maxAttempts counts every invocation, the first included. After failed
     * attempt n the next one is scheduled backoffMs * multiplier^(n-1) later,
     * scaled by a uniform factor in [0.5, 1.0] when jitter is on.
     */
    struct RetrySpec {
        uint32_t maxAttempts = 3;
        uint32_t backoffMs = 150;
        double multiplier = 2.0;
        bool jitter = true;
    };

    using GuardFn = std::function<bool(StepContext&)>;
    using EffectFn = std::function<Value(StepContext&)>;
    using ReducerFn = std::function<Value(const Value& accumulated, const Value& next)>;

    /// Two-way branch: then if when() holds, otherwise the else target if any
    struct PredicateBranch {
        std::function<bool(StepContext&)> when;
        std::string then;
        std::optional<std::string> otherwise;
    };

    /// N-way branch keyed by select(); an unmatched key goes to fallback if set, else nowhere
    struct MultiwayBranch {
        std::function<std::string(StepContext&)> select;
        std::map<std::string, std::string> cases;
        std::optional<std::string> fallback;
    };

    using BranchSpec = std::variant<PredicateBranch, MultiwayBranch>;

    /**
     * @brief Everything the engine knows about one step
     *
     * Only the plain-data fields survive a snapshot. Effect, guard, branch and
     * reducer are code and must be re-attached after deserialize().
     *
     * @code
     * StepDefinition route;
     * route.branch = MultiwayBranch{
     *     [](StepContext& ctx) { return ctx.input().at("country").asString(); },
     *     {{"US", "shipDomestic"}, {"CA", "shipCanada"}},
     *     "shipInternational"};
     * workflow->defineStep("route", route);
     * @endcode
     */
    struct StepDefinition {
        ExecutionDomain executionDomain = ExecutionDomain::Local;
        EffectFn effect;                        ///< Absent for pure branch/guard steps
        GuardFn guard;                          ///< false vetoes the execution
        std::optional<BranchSpec> branch;
        std::optional<RetrySpec> retry;         ///< nullopt: first failure is final
        BothModeOrder bothModeOrder = BothModeOrder::RemoteFirst;
        MergeStrategy merge = MergeStrategy::Last;
        ReducerFn reducer;                      ///< Required when merge is Reduce
        std::vector<std::string> staticNext;    ///< Downstream used when nothing else enqueued

        bool hasEffect() const { return static_cast<bool>(effect); }
        bool hasGuard() const { return static_cast<bool>(guard); }
        bool hasBranch() const { return branch.has_value(); }
    };

    struct QueueItem {
        std::string stepName;
        Value payload;
        int64_t enqueuedAtMs = 0;
        std::string traceId;
        uint32_t attempt = 1;   ///< 1-based; carried over when a retry re-enters the queue
    };

    /// Limits for one pump() call; 0 means unlimited
    struct Budgets {
        uint64_t maxSteps = 0;
        uint64_t maxMillis = 0;
    };

    /**
     * @brief Per-instance settings
     *
     * @code
     * WorkflowConfig config;
     * config.order = QueueOrder::Lifo;       // depth-first
     * config.budgets.maxSteps = 50;          // yield to the host every 50 steps
     * config.resumeMode = ResumeMode::Manual;
     * auto wf = engine.createWorkflow("import", config);
     * @endcode
     */
    struct WorkflowConfig {
        QueueOrder order = QueueOrder::Fifo;
        Budgets budgets;
        size_t logSize = DefaultStepLogSize;    ///< Ring entries kept per step
        ResumeMode resumeMode = ResumeMode::Auto;
        bool enableDebugLogging = false;        ///< Per-step trace lines on the global logger
    };

    /**
     * @brief Counters for one instance
     *
     * Bumped from the pumping thread and, for retries and suspensions, from
     * timer and bridge threads; read them through toSnapshot().
     */
    struct WorkflowStats {
        std::atomic<uint64_t> steps{0};         ///< Items executed, vetoed ones included
        std::atomic<uint64_t> failures{0};      ///< Failed attempts
        std::atomic<uint64_t> retries{0};       ///< Attempts rescheduled after a failure
        std::atomic<uint64_t> suspensions{0};   ///< Attempts that suspended on the bridge
        std::atomic<uint64_t> fallbacks{0};     ///< Remote executions that ran in-process instead
        std::atomic<uint64_t> vetoes{0};        ///< Executions a guard refused

        struct Snapshot {
            uint64_t steps = 0;
            uint64_t failures = 0;
            uint64_t retries = 0;
            uint64_t suspensions = 0;
            uint64_t fallbacks = 0;
            uint64_t vetoes = 0;
        };

        Snapshot toSnapshot() const {
            Snapshot snap;
            snap.steps = steps.load(std::memory_order_relaxed);
            snap.failures = failures.load(std::memory_order_relaxed);
            snap.retries = retries.load(std::memory_order_relaxed);
            snap.suspensions = suspensions.load(std::memory_order_relaxed);
            snap.fallbacks = fallbacks.load(std::memory_order_relaxed);
            snap.vetoes = vetoes.load(std::memory_order_relaxed);
            return snap;
        }

        void restore(const Snapshot& snap) {
            steps.store(snap.steps, std::memory_order_relaxed);
            failures.store(snap.failures, std::memory_order_relaxed);
            retries.store(snap.retries, std::memory_order_relaxed);
            suspensions.store(snap.suspensions, std::memory_order_relaxed);
            fallbacks.store(snap.fallbacks, std::memory_order_relaxed);
            vetoes.store(snap.vetoes, std::memory_order_relaxed);
        }
    };

    /// An attempt produced its output
    struct Continue {
        Value value;
    };

    /// An attempt is waiting on a bridge call; replay it when pending resolves
    struct Suspended {
        Bridge::PendingCallPtr pending;
    };

    using StepResult = std::variant<Continue, Suspended>;

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
