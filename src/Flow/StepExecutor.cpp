/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "StepExecutor.h"
#include "../Core/WorkflowErrors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include "StepContext.h"
#include "Workflow.h"
#include "WorkflowEngine.h"
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <future>

namespace FlowEngine {
namespace Core {
namespace Flow {

namespace {

    int64_t nowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    /// Message for whatever a guard, effect, branch or reducer threw
    std::string describe(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

    struct Side {
        ExecutionDomain domain;
        bool ok = false;
        Value output;
        std::string error;
    };

} // namespace

    StepExecutor::StepExecutor(Workflow& workflow)
        : _workflow(workflow)
        , _rng(std::random_device{}()) {
    }

    std::chrono::milliseconds StepExecutor::backoffDelay(const RetrySpec& spec, uint32_t failedAttempt, double jitterFactor) {
        auto exponent = failedAttempt > 0 ? failedAttempt - 1 : 0;
        double ms = static_cast<double>(spec.backoffMs) * std::pow(spec.multiplier, static_cast<double>(exponent));
        return std::chrono::milliseconds(std::llround(ms * jitterFactor));
    }

    double StepExecutor::jitterFactor() {
        std::uniform_real_distribution<double> dist(0.5, 1.0);
        return dist(_rng);
    }

    void StepExecutor::execute(const QueueItem& item) {
        FLOW_PROFILE_ZONE_NC("StepExecutor::execute", Debug::ProfileColors::Executor);
        FLOW_PROFILE_ZONE_TEXT(item.stepName.c_str(), item.stepName.size());

        auto def = _workflow._registry.find(item.stepName);
        if (!def) {
            _workflow._logs.append(item.stepName, StepLogLevel::Warn, {"unknown step", item.traceId});
            FLOW_LOG_WARNING_TRACE("StepExecutor", item.traceId, std::format(
                "'{}' dequeued unknown step '{}'; skipped", _workflow.id(), item.stepName));
            return;
        }

        auto processDomain = _workflow.engine().processDomain();
        auto domain = def->executionDomain == ExecutionDomain::Remote ? ExecutionDomain::Remote : ExecutionDomain::Local;
        if (processDomain == ExecutionDomain::Remote) {
            domain = ExecutionDomain::Remote;
        }

        StepContext ctx(_workflow, item.stepName, def, item.payload, item.traceId, domain, item.attempt);

        if (def->guard) {
            bool allowed = false;
            try {
                allowed = def->guard(ctx);
            } catch (...) {
                handleFailure(*def, item, std::format("guard threw: {}", describe(std::current_exception())));
                return;
            }
            if (!allowed) {
                _workflow._stats.vetoes.fetch_add(1, std::memory_order_relaxed);
                _workflow._logs.append(item.stepName, StepLogLevel::Info, {"guard: vetoed execution"});
                FLOW_LOG_DEBUG_TRACE("StepExecutor", item.traceId,
                    std::format("'{}' guard vetoed '{}'", _workflow.id(), item.stepName));
                return;
            }
        }

        WorkflowEvent before;
        before.traceId = item.traceId;
        before.input = item.payload;
        before.attempt = item.attempt;
        _workflow.emitStep(Events::StepBefore, item.stepName, before);

        Attempt attempt = dispatch(ctx, *def, item);

        if (attempt.status == Attempt::Status::Suspended) {
            _workflow._stats.suspensions.fetch_add(1, std::memory_order_relaxed);
            _workflow._logs.append(item.stepName, StepLogLevel::Info, {"suspended", item.traceId});
            _workflow.suspend(item, attempt.pending);

            WorkflowEvent suspended = before;
            _workflow.emitStep(Events::StepSuspended, item.stepName, suspended);
            return;
        }

        if (attempt.status == Attempt::Status::Failed) {
            handleFailure(*def, item, attempt.error);
            return;
        }

        try {
            _workflow.commitOutput(item.stepName, attempt.output);
            enqueueDownstream(ctx, *def, attempt.output);
        } catch (...) {
            handleFailure(*def, item, std::format("branch failed: {}", describe(std::current_exception())));
            return;
        }

        if (_workflow.config().enableDebugLogging) {
            FLOW_LOG_DEBUG_TRACE("StepExecutor", item.traceId, std::format("'{}' step '{}' attempt {} done",
                _workflow.id(), item.stepName, item.attempt));
        }

        WorkflowEvent after = before;
        after.output = attempt.output;
        _workflow.emitStep(Events::StepAfter, item.stepName, after);
    }

    StepExecutor::Attempt StepExecutor::dispatch(StepContext& ctx, const StepDefinition& def, const QueueItem& item) {
        // Requests served for another process always run here
        if (_workflow.engine().processDomain() == ExecutionDomain::Remote) {
            return runLocal(ctx, def);
        }

        switch (def.executionDomain) {
            case ExecutionDomain::Local:  return runLocal(ctx, def);
            case ExecutionDomain::Remote: return runRemote(ctx, def, item);
            case ExecutionDomain::Both:   return runBoth(ctx, def, item);
        }
        return runLocal(ctx, def);
    }

    StepExecutor::Attempt StepExecutor::runLocal(StepContext& ctx, const StepDefinition& def) {
        if (!def.effect) {
            return Attempt::success(ctx.input());
        }
        try {
            return Attempt::success(def.effect(ctx));
        } catch (...) {
            return Attempt::failure(describe(std::current_exception()));
        }
    }

    Bridge::BridgeRequest StepExecutor::makeRequest(const StepContext& ctx) const {
        Bridge::BridgeRequest request;
        request.instanceId = _workflow.id();
        request.stepName = ctx.stepName();
        request.payload = ctx.input();
        request.traceId = ctx.traceId();
        return request;
    }

    StepExecutor::Attempt StepExecutor::runRemote(StepContext& ctx, const StepDefinition& def, const QueueItem&) {
        auto* bridge = _workflow.engine().bridge();
        if (!bridge) {
            return fallBackToLocal(ctx, def, "no bridge available");
        }

        Bridge::BridgeOutcome outcome;
        try {
            outcome = bridge->call(makeRequest(ctx));
        } catch (const BridgeError&) {
            return resolveRemote(ctx, def, nullptr, std::current_exception());
        } catch (...) {
            return Attempt::failure(std::format("bridge call failed: {}", describe(std::current_exception())));
        }
        return resolveRemote(ctx, def, &outcome, nullptr);
    }

    StepExecutor::Attempt StepExecutor::resolveRemote(StepContext& ctx, const StepDefinition& def,
                                                      const Bridge::BridgeOutcome* outcome, std::exception_ptr error) {
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const BridgeTimeout& e) {
                return Attempt::failure(e.what());
            } catch (const BridgeError& e) {
                return fallBackToLocal(ctx, def, e.what());
            }
        }

        if (auto* pending = std::get_if<Bridge::PendingCallPtr>(outcome)) {
            return Attempt::suspended(*pending);
        }

        const auto& response = std::get<Bridge::BridgeResponse>(*outcome);
        for (const auto& raw : response.logs) {
            try {
                _workflow._logs.appendEntry(ctx.stepName(), StepLogEntry::fromValue(raw));
            } catch (const std::invalid_argument&) {
                _workflow._logs.append(ctx.stepName(), StepLogLevel::Info, {"remote", raw});
            }
        }
        if (!response.ok) {
            return Attempt::failure(response.error.empty() ? std::string("remote effect failed") : response.error);
        }
        return Attempt::success(response.value);
    }

    StepExecutor::Attempt StepExecutor::fallBackToLocal(StepContext& ctx, const StepDefinition& def, const std::string& reason) {
        _workflow._stats.fallbacks.fetch_add(1, std::memory_order_relaxed);
        FLOW_PROFILE_MESSAGE_L("bridge fallback");
        _workflow._logs.append(ctx.stepName(), StepLogLevel::Warn, {"bridge fallback", reason});
        FLOW_LOG_WARNING_TRACE("Bridge", ctx.traceId(), std::format("'{}' step '{}' running in-process: {}",
            _workflow.id(), ctx.stepName(), reason));

        ctx._executionDomain = ExecutionDomain::Remote;
        return runLocal(ctx, def);
    }

    StepExecutor::Attempt StepExecutor::runBoth(StepContext& ctx, const StepDefinition& def, const QueueItem& item) {
        std::vector<Side> sides;

        auto localSide = [&]() {
            ctx._executionDomain = ExecutionDomain::Local;
            Attempt a = runLocal(ctx, def);
            sides.push_back({ExecutionDomain::Local, a.status == Attempt::Status::Succeeded, a.output, a.error});
        };
        auto recordRemote = [&](Attempt a) {
            sides.push_back({ExecutionDomain::Remote, a.status == Attempt::Status::Succeeded, a.output, a.error});
        };

        switch (def.bothModeOrder) {
            case BothModeOrder::RemoteFirst: {
                Attempt remote = runRemote(ctx, def, item);
                if (remote.status == Attempt::Status::Suspended) return remote;
                recordRemote(std::move(remote));
                localSide();
                break;
            }
            case BothModeOrder::LocalFirst: {
                localSide();
                Attempt remote = runRemote(ctx, def, item);
                if (remote.status == Attempt::Status::Suspended) return remote;
                recordRemote(std::move(remote));
                break;
            }
            case BothModeOrder::Parallel: {
                auto* bridge = _workflow.engine().bridge();
                if (bridge && bridge->callerMayBlock()) {
                    auto request = makeRequest(ctx);
                    auto inFlight = std::async(std::launch::async, [bridge, request]() {
                        return bridge->call(request);
                    });
                    localSide();

                    Bridge::BridgeOutcome outcome;
                    std::exception_ptr error;
                    try {
                        outcome = inFlight.get();
                    } catch (const BridgeError&) {
                        error = std::current_exception();
                    } catch (...) {
                        recordRemote(Attempt::failure(std::format("bridge call failed: {}", describe(std::current_exception()))));
                        break;
                    }
                    // Fallback runs the effect here, so it has to wait for the local side
                    recordRemote(resolveRemote(ctx, def, error ? nullptr : &outcome, error));
                } else {
                    // A suspending bridge returns at once; a missing one falls back in-process
                    Attempt remote = runRemote(ctx, def, item);
                    if (remote.status == Attempt::Status::Suspended) return remote;
                    localSide();
                    recordRemote(std::move(remote));
                }
                break;
            }
        }

        std::vector<Value> outputs;
        std::vector<std::string> errors;
        for (const auto& side : sides) {
            if (side.ok) {
                outputs.push_back(side.output);
            } else {
                _workflow._logs.append(ctx.stepName(), StepLogLevel::Warn, {toString(side.domain), "side failed", side.error});
                errors.push_back(std::format("{}: {}", toString(side.domain), side.error));
            }
        }
        ctx._executionDomain = ExecutionDomain::Both;

        if (outputs.empty()) {
            std::string joined;
            for (const auto& e : errors) {
                if (!joined.empty()) joined += "; ";
                joined += e;
            }
            return Attempt::failure(std::format("both sides failed ({})", joined));
        }

        switch (def.merge) {
            case MergeStrategy::Last:
                return Attempt::success(outputs.back());
            case MergeStrategy::All:
                return Attempt::success(Value(outputs));
            case MergeStrategy::Reduce: {
                if (!def.reducer) {
                    return Attempt::failure("reduce merge without a reducer");
                }
                try {
                    Value accumulated = outputs.front();
                    for (size_t i = 1; i < outputs.size(); ++i) {
                        accumulated = def.reducer(accumulated, outputs[i]);
                    }
                    return Attempt::success(std::move(accumulated));
                } catch (...) {
                    return Attempt::failure(std::format("reducer threw: {}", describe(std::current_exception())));
                }
            }
        }
        return Attempt::success(outputs.back());
    }

    void StepExecutor::enqueueDownstream(StepContext& ctx, const StepDefinition& def, const Value& output) {
        const auto& name = ctx.stepName();

        if (def.branch) {
            if (auto* predicate = std::get_if<PredicateBranch>(&*def.branch)) {
                bool taken = predicate->when ? predicate->when(ctx) : false;
                if (taken) {
                    ctx.enqueueNext(predicate->then, output);
                } else if (predicate->otherwise) {
                    ctx.enqueueNext(*predicate->otherwise, output);
                }
            } else if (auto* multiway = std::get_if<MultiwayBranch>(&*def.branch)) {
                std::string key = multiway->select ? multiway->select(ctx) : std::string();
                auto it = multiway->cases.find(key);
                if (it != multiway->cases.end()) {
                    ctx.enqueueNext(it->second, output);
                } else if (multiway->fallback) {
                    ctx.enqueueNext(*multiway->fallback, output);
                } else {
                    FLOW_LOG_DEBUG_CAT("StepExecutor", std::format(
                        "'{}' step '{}' branch key '{}' matched no case", _workflow.id(), name, key));
                }
            }
        }

        if (ctx.enqueuedAny()) {
            return;
        }

        std::vector<std::string> next = def.staticNext;
        for (const auto& target : _workflow._registry.edges(name)) {
            if (std::find(next.begin(), next.end(), target) == next.end()) {
                next.push_back(target);
            }
        }
        for (const auto& target : next) {
            ctx.enqueueNext(target, output);
        }
    }

    void StepExecutor::handleFailure(const StepDefinition& def, const QueueItem& item, const std::string& error) {
        _workflow._stats.failures.fetch_add(1, std::memory_order_relaxed);
        _workflow._logs.append(item.stepName, StepLogLevel::Error, {error, "attempt", item.attempt});

        if (def.retry && item.attempt < def.retry->maxAttempts) {
            auto delay = backoffDelay(*def.retry, item.attempt, def.retry->jitter ? jitterFactor() : 1.0);
            _workflow._stats.retries.fetch_add(1, std::memory_order_relaxed);
            _workflow._logs.append(item.stepName, StepLogLevel::Warn,
                                   {"retry", item.attempt + 1, static_cast<int64_t>(delay.count())});
            FLOW_LOG_DEBUG_TRACE("StepExecutor", item.traceId, std::format("'{}' step '{}' retry {} in {}ms: {}",
                _workflow.id(), item.stepName, item.attempt + 1, delay.count(), error));

            QueueItem next = item;
            next.attempt = item.attempt + 1;
            next.enqueuedAtMs = nowMs();
            _workflow.scheduleRetry(std::move(next), delay);
            return;
        }

        FLOW_LOG_WARNING_TRACE("StepExecutor", item.traceId, std::format("'{}' step '{}' failed after {} attempt(s): {}",
            _workflow.id(), item.stepName, item.attempt, error));

        WorkflowEvent event;
        event.traceId = item.traceId;
        event.input = item.payload;
        event.attempt = item.attempt;
        event.error = error;
        _workflow.emitStep(Events::StepError, item.stepName, event);
        _workflow.emit(Events::WorkflowErrorTopic, event);
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
