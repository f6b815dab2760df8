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
#include "StepRegistry.h"
#include "WorkflowTypes.h"
#include <chrono>
#include <exception>
#include <random>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Flow {

    class StepContext;

    /**
     * @brief Runs one dequeued item of a workflow
     *
     * For each item: evaluate the guard (a veto ends it quietly), emit
     * step:before, run the effect in the step's execution domain, then commit
     * the output and enqueue downstream steps. A failed attempt is either
     * rescheduled on the timer per the step's RetrySpec or reported once as
     * step:error plus workflow:error. An attempt that has to wait on a
     * non-blocking bridge call is parked as suspended and replayed when the
     * call completes.
     *
     * Remote dispatch goes through the engine's bridge. A bridge timeout is an
     * ordinary failed attempt. Any other bridge fault, or having no bridge,
     * makes the step run in-process instead (counted as a fallback), since
     * resending the same request would fail the same way.
     *
     * Nothing thrown by user code leaves execute().
     */
    class StepExecutor {
    public:
        explicit StepExecutor(Workflow& workflow);

        void execute(const QueueItem& item);

        /**
         * @brief Delay before the attempt after failedAttempt
         *
         * backoffMs * multiplier^(failedAttempt-1) * jitterFactor, rounded to
         * whole milliseconds.
         */
        static std::chrono::milliseconds backoffDelay(const RetrySpec& spec, uint32_t failedAttempt, double jitterFactor = 1.0);

    private:
        struct Attempt {
            enum class Status : uint8_t { Succeeded, Failed, Suspended };

            Status status = Status::Failed;
            Value output;
            std::string error;
            Bridge::PendingCallPtr pending;

            static Attempt success(Value v) { Attempt a; a.status = Status::Succeeded; a.output = std::move(v); return a; }
            static Attempt failure(std::string e) { Attempt a; a.status = Status::Failed; a.error = std::move(e); return a; }
            static Attempt suspended(Bridge::PendingCallPtr p) { Attempt a; a.status = Status::Suspended; a.pending = std::move(p); return a; }
        };

        Attempt dispatch(StepContext& ctx, const StepDefinition& def, const QueueItem& item);
        Attempt runLocal(StepContext& ctx, const StepDefinition& def);
        Attempt runRemote(StepContext& ctx, const StepDefinition& def, const QueueItem& item);
        Attempt runBoth(StepContext& ctx, const StepDefinition& def, const QueueItem& item);

        /// Turns a bridge outcome (or the error a call raised) into an attempt
        Attempt resolveRemote(StepContext& ctx, const StepDefinition& def,
                              const Bridge::BridgeOutcome* outcome, std::exception_ptr error);
        Attempt fallBackToLocal(StepContext& ctx, const StepDefinition& def, const std::string& reason);

        Bridge::BridgeRequest makeRequest(const StepContext& ctx) const;

        /// Branch first, then static next and edges when nothing was enqueued
        void enqueueDownstream(StepContext& ctx, const StepDefinition& def, const Value& output);

        void handleFailure(const StepDefinition& def, const QueueItem& item, const std::string& error);

        double jitterFactor();

        Workflow& _workflow;
        std::mt19937 _rng;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
