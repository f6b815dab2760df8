/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "Workflow.h"
#include "../Core/WorkflowErrors.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include "WorkflowEngine.h"
#include <chrono>
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Flow {

namespace {

    /// Releases the pump's running flag when a pass ends, however it ends
    class RunningFlag {
    public:
        explicit RunningFlag(WorkflowScheduler& scheduler) : _scheduler(scheduler) {}
        ~RunningFlag() { _scheduler.release(); }

        RunningFlag(const RunningFlag&) = delete;
        RunningFlag& operator=(const RunningFlag&) = delete;

    private:
        WorkflowScheduler& _scheduler;
    };

    int64_t nowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    Value stringList(const std::vector<std::string>& names) {
        Value::Array out;
        out.reserve(names.size());
        for (const auto& name : names) {
            out.emplace_back(name);
        }
        return Value(std::move(out));
    }

    std::vector<std::string> readStringList(const Value& value, const char* what) {
        if (!value.isArray()) {
            throw std::invalid_argument(std::format("Snapshot field '{}' must be an array", what));
        }
        std::vector<std::string> out;
        for (const auto& item : value.asArray()) {
            out.push_back(item.asString());
        }
        return out;
    }

    uint64_t readCount(const Value& object, const char* key) {
        const Value* v = object.find(key);
        if (!v) return 0;
        auto n = v->asInt();
        return n < 0 ? 0 : static_cast<uint64_t>(n);
    }

    Value retryToValue(const std::optional<RetrySpec>& retry) {
        if (!retry) {
            return Value(false);
        }
        Value out(Value::Object{});
        out["maxAttempts"] = retry->maxAttempts;
        out["backoffMs"] = retry->backoffMs;
        out["multiplier"] = retry->multiplier;
        out["jitter"] = retry->jitter;
        return out;
    }

    std::optional<RetrySpec> retryFromValue(const Value& value) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        RetrySpec spec;
        if (const Value* v = value.find("maxAttempts")) spec.maxAttempts = static_cast<uint32_t>(v->asInt());
        if (const Value* v = value.find("backoffMs")) spec.backoffMs = static_cast<uint32_t>(v->asInt());
        if (const Value* v = value.find("multiplier")) spec.multiplier = v->asDouble();
        if (const Value* v = value.find("jitter")) spec.jitter = v->asBool();
        return spec;
    }

    template<typename Enum>
    Enum readEnum(const Value& object, const char* key, Enum fallback,
                  std::optional<Enum> (*parse)(std::string_view)) {
        const Value* v = object.find(key);
        if (!v) return fallback;
        auto parsed = parse(v->asString());
        if (!parsed) {
            throw std::invalid_argument(std::format("Snapshot has unknown {} '{}'", key, v->asString()));
        }
        return *parsed;
    }

} // namespace

    Workflow::Workflow(WorkflowEngine& engine, std::string id, WorkflowConfig config)
        : _engine(engine)
        , _id(std::move(id))
        , _config(config)
        , _scheduler(config.order, config.budgets)
        , _executor(*this)
        , _logs(config.logSize)
        , _traceRng(std::random_device{}()) {
    }

    Workflow::~Workflow() {
        std::lock_guard<std::mutex> lock(_watchMutex);
        for (const auto& [step, watchId] : _watchers) {
            _engine.store().unwatch(watchId);
        }
        _watchers.clear();
    }

    Workflow& Workflow::defineStep(const std::string& name, StepDefinition definition) {
        bool added = _registry.define(name, std::move(definition));
        ensureWatcher(name);
        FLOW_LOG_TRACE_CAT("Workflow", std::format("'{}' {} step '{}'", _id, added ? "defined" : "replaced", name));
        return *this;
    }

    Workflow& Workflow::connect(const std::string& from, const std::vector<std::string>& to) {
        _registry.connect(from, to);
        return *this;
    }

    void Workflow::start(const std::string& stepName, Value payload) {
        if (!_registry.contains(stepName)) {
            throw std::invalid_argument(std::format("Workflow '{}' has no step '{}'", _id, stepName));
        }
        enqueue(stepName, std::move(payload));
        pump();
    }

    std::string Workflow::enqueue(const std::string& stepName, Value payload, std::string traceId) {
        if (traceId.empty()) {
            traceId = nextTraceId();
        }
        QueueItem item;
        item.stepName = stepName;
        item.payload = std::move(payload);
        item.enqueuedAtMs = nowMs();
        item.traceId = traceId;
        _scheduler.push(std::move(item));
        return traceId;
    }

    size_t Workflow::pump() {
        FLOW_PROFILE_ZONE_NC("Workflow::pump", Debug::ProfileColors::Scheduler);
        size_t executed = 0;
        bool budgetHit = false;

        // Budgets cover the whole call, including passes picked up after a release
        auto pumpStart = std::chrono::steady_clock::now();

        // Another pump is already draining; it will see whatever we queued
        while (!budgetHit && _scheduler.tryAcquire()) {
            {
                RunningFlag running(_scheduler);
                emit(Events::WorkflowStart, WorkflowEvent{});

                _scheduler.drainInbox();
                while (true) {
                    auto item = _scheduler.take();
                    if (!item && _scheduler.drainInbox() > 0) {
                        item = _scheduler.take();
                    }
                    if (!item) {
                        break;
                    }

                    try {
                        _executor.execute(*item);
                    } catch (const std::exception& e) {
                        FLOW_LOG_ERROR_CAT("Workflow", std::format(
                            "'{}' step '{}' escaped the executor: {}", _id, item->stepName, e.what()));
                    } catch (...) {
                        FLOW_LOG_ERROR_CAT("Workflow", std::format(
                            "'{}' step '{}' escaped the executor with a non-standard exception", _id, item->stepName));
                    }

                    ++executed;
                    _stats.steps.fetch_add(1, std::memory_order_relaxed);

                    if (_scheduler.budgetExhausted(executed, pumpStart)) {
                        budgetHit = true;
                        break;
                    }
                }
            }
            FLOW_PROFILE_PLOT("Workflow queue", static_cast<int64_t>(_scheduler.queueSize()));

            if (_scheduler.queueEmpty()) {
                emit(Events::WorkflowIdle, WorkflowEvent{});
                if (finished()) {
                    emit(Events::WorkflowFinish, WorkflowEvent{});
                }
            }

            if (budgetHit) {
                FLOW_LOG_DEBUG_CAT("Workflow", std::format(
                    "'{}' yielded after {} steps with {} queued", _id, executed, _scheduler.queueSize()));
                break;
            }

            // Work delivered by another thread between our last take() and release()
            if (_config.resumeMode != ResumeMode::Auto ||
                (_scheduler.queueEmpty() && !_scheduler.hasInbox())) {
                break;
            }
            budgetHit = _scheduler.budgetExhausted(executed, pumpStart);
        }

        return executed;
    }

    size_t Workflow::runSync() {
        _stats.steps.store(0, std::memory_order_relaxed);
        return pump();
    }

    bool Workflow::set(const std::string& stepName, Value value) {
        auto& store = _engine.store();
        return store.set(store.resolve(nodePath(stepName)), std::move(value));
    }

    Value Workflow::value(const std::string& stepName) const {
        auto& store = _engine.store();
        auto node = store.resolve(nodePath(stepName), false);
        return node == Store::InvalidNode ? Value() : store.get(node);
    }

    Value Workflow::output(const std::string& stepName) const {
        auto& store = _engine.store();
        auto node = store.resolve(outputPath(stepName), false);
        return node == Store::InvalidNode ? Value() : store.get(node);
    }

    Workflow::Unsubscribe Workflow::on(const std::string& topic, EventHandler handler) {
        auto id = subscribe(topic, std::move(handler));
        std::weak_ptr<WorkflowEventBus> bus = _engine.eventBusRef();
        return [bus, topic, id]() {
            if (auto b = bus.lock()) {
                b->unsubscribe(topic, id);
            }
        };
    }

    Workflow::HandlerId Workflow::subscribe(const std::string& topic, EventHandler handler) {
        return _engine.eventBus().subscribe(topic,
            [instanceId = _id, handler = std::move(handler)](const WorkflowEvent& event) {
                if (event.instanceId == instanceId) {
                    handler(event);
                }
            });
    }

    bool Workflow::off(const std::string& topic, HandlerId id) {
        return _engine.eventBus().unsubscribe(topic, id);
    }

    std::string Workflow::serialize() const {
        const auto& codec = _engine.snapshotCodec();
        if (!codec) {
            throw SerializationUnsupported(std::format("Workflow '{}' cannot serialize: no snapshot codec", _id));
        }
        return codec->encode(toSnapshotValue());
    }

    void Workflow::deserialize(const std::string& text) {
        const auto& codec = _engine.snapshotCodec();
        if (!codec) {
            throw SerializationUnsupported(std::format("Workflow '{}' cannot deserialize: no snapshot codec", _id));
        }
        restoreSnapshotValue(codec->decode(text));
    }

    Value Workflow::toSnapshotValue() const {
        Value snapshot(Value::Object{});
        snapshot["id"] = _id;

        Value steps(Value::Object{});
        for (const auto& name : _registry.stepNames()) {
            auto def = _registry.find(name);
            if (!def) continue;
            Value step(Value::Object{});
            step["executionDomain"] = toString(def->executionDomain);
            step["bothModeOrder"] = toString(def->bothModeOrder);
            step["merge"] = toString(def->merge);
            step["retry"] = retryToValue(def->retry);
            step["staticNext"] = stringList(def->staticNext);
            step["meta"] = StepRegistry::metaOf(*def);
            steps[name] = std::move(step);
        }
        snapshot["steps"] = std::move(steps);

        Value edges(Value::Object{});
        for (const auto& [from, to] : _registry.allEdges()) {
            edges[from] = stringList(to);
        }
        snapshot["edges"] = std::move(edges);

        Value::Array queue;
        for (const auto& item : _scheduler.queueSnapshot()) {
            Value entry(Value::Object{});
            entry["stepName"] = item.stepName;
            entry["payload"] = item.payload;
            entry["enqueuedAtMs"] = item.enqueuedAtMs;
            entry["traceId"] = item.traceId;
            entry["attempt"] = item.attempt;
            queue.push_back(std::move(entry));
        }
        snapshot["queue"] = Value(std::move(queue));

        auto s = _stats.toSnapshot();
        Value stats(Value::Object{});
        stats["steps"] = s.steps;
        stats["failures"] = s.failures;
        stats["retries"] = s.retries;
        stats["suspensions"] = s.suspensions;
        stats["fallbacks"] = s.fallbacks;
        stats["vetoes"] = s.vetoes;
        snapshot["stats"] = std::move(stats);

        snapshot["shared"] = Value(_shared);
        snapshot["logs"] = _logs.toValue();
        return snapshot;
    }

    void Workflow::restoreSnapshotValue(const Value& snapshot) {
        if (!snapshot.isObject()) {
            throw std::invalid_argument("Workflow snapshot must be an object");
        }

        try {
            // Parse everything first so a bad snapshot leaves this instance untouched
            std::vector<std::pair<std::string, StepDefinition>> missingSteps;
            if (const Value* steps = snapshot.find("steps")) {
                for (const auto& [name, step] : steps->asObject()) {
                    if (_registry.contains(name)) continue;
                    StepDefinition def;
                    def.executionDomain = readEnum(step, "executionDomain", def.executionDomain, &parseExecutionDomain);
                    def.bothModeOrder = readEnum(step, "bothModeOrder", def.bothModeOrder, &parseBothModeOrder);
                    def.merge = readEnum(step, "merge", def.merge, &parseMergeStrategy);
                    if (def.merge == MergeStrategy::Reduce) {
                        // The reducer is code and did not travel with the snapshot
                        def.merge = MergeStrategy::Last;
                    }
                    if (const Value* retry = step.find("retry")) def.retry = retryFromValue(*retry);
                    if (const Value* next = step.find("staticNext")) def.staticNext = readStringList(*next, "staticNext");
                    missingSteps.emplace_back(name, std::move(def));
                }
            }

            std::optional<std::map<std::string, std::vector<std::string>>> edges;
            if (const Value* edgesValue = snapshot.find("edges")) {
                edges.emplace();
                for (const auto& [from, to] : edgesValue->asObject()) {
                    (*edges)[from] = readStringList(to, "edges");
                }
            }

            std::optional<std::vector<QueueItem>> queue;
            if (const Value* queueValue = snapshot.find("queue")) {
                queue.emplace();
                for (const auto& entry : queueValue->asArray()) {
                    QueueItem item;
                    item.stepName = entry.at("stepName").asString();
                    if (const Value* v = entry.find("payload")) item.payload = *v;
                    if (const Value* v = entry.find("enqueuedAtMs")) item.enqueuedAtMs = v->asInt();
                    if (const Value* v = entry.find("traceId")) item.traceId = v->asString();
                    if (const Value* v = entry.find("attempt")) item.attempt = static_cast<uint32_t>(v->asInt());
                    if (item.attempt == 0) item.attempt = 1;
                    queue->push_back(std::move(item));
                }
            }

            std::optional<WorkflowStats::Snapshot> stats;
            if (const Value* statsValue = snapshot.find("stats")) {
                stats.emplace();
                stats->steps = readCount(*statsValue, "steps");
                stats->failures = readCount(*statsValue, "failures");
                stats->retries = readCount(*statsValue, "retries");
                stats->suspensions = readCount(*statsValue, "suspensions");
                stats->fallbacks = readCount(*statsValue, "fallbacks");
                stats->vetoes = readCount(*statsValue, "vetoes");
            }

            std::optional<Value::Object> shared;
            if (const Value* sharedValue = snapshot.find("shared")) {
                shared = sharedValue->asObject();
            }

            std::optional<StepLog> logs;
            if (const Value* logsValue = snapshot.find("logs")) {
                logs.emplace(_config.logSize);
                logs->restore(*logsValue);
            }

            for (auto& [name, def] : missingSteps) {
                defineStep(name, std::move(def));
            }
            if (edges) _registry.replaceEdges(std::move(*edges));
            if (queue) _scheduler.replaceQueue(std::move(*queue));
            if (stats) _stats.restore(*stats);
            if (shared) _shared = std::move(*shared);
            if (logs) _logs.restore(logs->toValue());
        } catch (const std::runtime_error& e) {
            // Value accessors report type mismatches as runtime_error
            throw std::invalid_argument(std::format("Workflow snapshot is malformed: {}", e.what()));
        } catch (const std::out_of_range& e) {
            throw std::invalid_argument(std::format("Workflow snapshot is malformed: {}", e.what()));
        }

        FLOW_LOG_DEBUG_CAT("Workflow", std::format("'{}' restored with {} queued", _id, _scheduler.queueSize()));
    }

    std::string Workflow::nodePath(const std::string& stepName) const {
        return std::format("flows.{}.nodes.{}", _id, stepName);
    }

    std::string Workflow::outputPath(const std::string& stepName) const {
        return std::format("flows.{}.outputs.{}", _id, stepName);
    }

    void Workflow::emit(const std::string& topic, WorkflowEvent event) {
        event.topic = topic;
        event.instanceId = _id;
        event.timestampMs = nowMs();
        _engine.eventBus().publish(topic, event);
    }

    void Workflow::emitStep(const char* topic, const std::string& stepName, WorkflowEvent event) {
        event.stepName = stepName;
        emit(topic, event);
        emit(Events::forStep(topic, stepName), std::move(event));
    }

    void Workflow::ensureWatcher(const std::string& stepName) {
        std::lock_guard<std::mutex> lock(_watchMutex);
        if (_watchers.contains(stepName)) {
            return;
        }

        auto& store = _engine.store();
        auto node = store.resolve(nodePath(stepName));
        std::weak_ptr<Workflow> weak = weak_from_this();
        _watchers[stepName] = store.watch(node, [weak, stepName](const Value& current, const Value&) {
            if (auto wf = weak.lock()) {
                wf->enqueue(stepName, current);
                wf->pump();
            }
        });
    }

    void Workflow::commitOutput(const std::string& stepName, const Value& output) {
        auto& store = _engine.store();
        store.set(store.resolve(outputPath(stepName)), output);
    }

    std::string Workflow::nextTraceId() {
        std::lock_guard<std::mutex> lock(_traceMutex);
        return std::format("{:x}-{}", _traceRng(), ++_traceCounter);
    }

    void Workflow::deliver(QueueItem item) {
        _scheduler.postToInbox(std::move(item));
        if (_config.resumeMode == ResumeMode::Auto) {
            pump();
        }
    }

    void Workflow::scheduleRetry(QueueItem item, std::chrono::milliseconds delay) {
        _pendingRetries.fetch_add(1);
        std::weak_ptr<Workflow> weak = weak_from_this();
        _engine.timer().schedule(delay, [weak, item = std::move(item)]() {
            if (auto wf = weak.lock()) {
                wf->_pendingRetries.fetch_sub(1);
                wf->deliver(item);
            }
        });
    }

    void Workflow::suspend(QueueItem item, const Bridge::PendingCallPtr& pending) {
        _suspended.fetch_add(1);
        std::weak_ptr<Workflow> weak = weak_from_this();
        pending->onReady([weak, item = std::move(item)]() {
            if (auto wf = weak.lock()) {
                wf->_suspended.fetch_sub(1);
                wf->deliver(item);
            }
        });
    }

    bool Workflow::finished() const {
        return _pendingRetries.load() == 0 && _suspended.load() == 0 &&
               _scheduler.queueEmpty() && !_scheduler.hasInbox();
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
