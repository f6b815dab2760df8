/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/Core/WorkflowErrors.h"
#include "../src/Flow/WorkflowEngine.h"
#include "../src/Store/MemoryStore.h"
#include "TestHelpers.h"
#include <stdexcept>
#include <string>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Flow;
using namespace FlowEngine::Core::Testing;

namespace {

    EngineServices manualServices() {
        EngineServices services;
        services.timer = std::make_shared<ManualTimerService>();
        return services;
    }

}

SCENARIO("A paused workflow survives a snapshot", "[serialization]") {
    GIVEN("A workflow that yielded with one step still queued") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices());

        WorkflowConfig config;
        config.budgets.maxSteps = 1;
        auto source = engine.createWorkflow("import", config);

        StepDefinition fetch;
        fetch.executionDomain = ExecutionDomain::Remote;
        fetch.effect = [](StepContext& ctx) {
            ctx.shared()["cursor"] = 7;
            ctx.log("fetched", 3);
            return Value(Value::Array{Value(1), Value(2), Value(3)});
        };
        RetrySpec retry;
        retry.maxAttempts = 4;
        retry.backoffMs = 250;
        retry.jitter = false;
        fetch.retry = retry;
        fetch.staticNext = {"store"};
        source->defineStep("fetch", fetch);

        StepDefinition save;
        save.effect = [](StepContext& ctx) { return Value(static_cast<int64_t>(ctx.input().asArray().size())); };
        source->defineStep("store", save);
        source->connect("fetch", "audit");

        StepDefinition audit;
        source->defineStep("audit", audit);

        source->enqueue("fetch", Value(), "trace-import");
        source->pump();
        REQUIRE(source->queueSize() == 2);

        auto text = source->serialize();

        WHEN("It is restored into a fresh engine") {
            Store::MemoryStore otherStore;
            WorkflowEngine other(otherStore, {}, manualServices());
            auto restored = other.createWorkflow("import", config);
            restored->deserialize(text);

            THEN("The queue comes back in order with trace ids and payloads") {
                auto queue = restored->queueSnapshot();
                REQUIRE(queue.size() == 2);
                REQUIRE(queue[0].stepName == "store");
                REQUIRE(queue[0].traceId == "trace-import");
                REQUIRE(queue[0].payload.asArray().size() == 3);
                REQUIRE(queue[1].stepName == "audit");
                REQUIRE(queue[0].enqueuedAtMs == source->queueSnapshot()[0].enqueuedAtMs);
            }

            THEN("Stats, shared state, edges and logs come back") {
                REQUIRE(restored->getStats().steps == 1);
                REQUIRE(restored->shared().at("cursor") == Value(7));
                REQUIRE(restored->edges("fetch") == std::vector<std::string>{"audit"});
                REQUIRE(restored->logs().archive("fetch").size() == source->logs().archive("fetch").size());
            }

            THEN("Steps exist as metadata only") {
                auto def = restored->findStep("fetch");
                REQUIRE(def != nullptr);
                REQUIRE_FALSE(def->hasEffect());
                REQUIRE(def->executionDomain == ExecutionDomain::Remote);
                REQUIRE(def->retry.has_value());
                REQUIRE(def->retry->maxAttempts == 4);
                REQUIRE(def->retry->backoffMs == 250);
                REQUIRE_FALSE(def->retry->jitter);
                REQUIRE(def->staticNext == std::vector<std::string>{"store"});
            }

            AND_WHEN("Code is re-attached and the host pumps") {
                restored->defineStep("store", save);
                restored->pump();
                restored->pump();

                THEN("The remaining work runs") {
                    REQUIRE(restored->output("store") == Value(3));
                    REQUIRE(restored->queueSize() == 0);
                }
            }
        }

        WHEN("It is restored into an instance that already defines the steps") {
            Store::MemoryStore otherStore;
            WorkflowEngine other(otherStore, {}, manualServices());
            auto restored = other.createWorkflow("import");
            restored->defineStep("store", save);
            restored->deserialize(text);

            THEN("Local definitions keep their code") {
                REQUIRE(restored->findStep("store")->hasEffect());
            }
        }
    }
}

TEST_CASE("Reduce merges restore as last", "[serialization]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices());
    auto source = engine.createWorkflow("merge");

    StepDefinition both;
    both.executionDomain = ExecutionDomain::Both;
    both.merge = MergeStrategy::Reduce;
    both.reducer = [](const Value& a, const Value&) { return a; };
    source->defineStep("both", both);

    auto restored = engine.createWorkflow("mergeCopy");
    restored->restoreSnapshotValue(source->toSnapshotValue());

    auto def = restored->findStep("both");
    REQUIRE(def != nullptr);
    CHECK(def->executionDomain == ExecutionDomain::Both);
    CHECK(def->merge == MergeStrategy::Last);
}

TEST_CASE("Snapshots need a codec", "[serialization]") {
    Store::MemoryStore store;
    EngineServices services = manualServices();
    services.codec = nullptr;
    WorkflowEngine engine(store, {}, services);
    auto wf = engine.createWorkflow("nocodec");

    CHECK_THROWS_AS(wf->serialize(), SerializationUnsupported);
    CHECK_THROWS_AS(wf->deserialize("{}"), SerializationUnsupported);

    // The value form does not need a codec
    CHECK(wf->toSnapshotValue().at("id") == Value("nocodec"));
}

TEST_CASE("Malformed snapshots are rejected without side effects", "[serialization]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices());
    auto wf = engine.createWorkflow("strict");
    wf->defineStep("A", StepDefinition{});
    wf->enqueue("A", 1);

    SECTION("Not JSON") {
        CHECK_THROWS_AS(wf->deserialize("{{{"), std::invalid_argument);
    }

    SECTION("Not an object") {
        CHECK_THROWS_AS(wf->deserialize("[1, 2]"), std::invalid_argument);
    }

    SECTION("A queue that is not a list") {
        CHECK_THROWS_AS(wf->deserialize(R"({"queue": 5})"), std::invalid_argument);
    }

    SECTION("A queue item without a step name") {
        CHECK_THROWS_AS(wf->deserialize(R"({"queue": [{"payload": 1}], "shared": {"x": 1}})"), std::invalid_argument);
        CHECK(wf->shared().empty());
    }

    SECTION("An unknown execution domain") {
        CHECK_THROWS_AS(wf->deserialize(R"({"steps": {"B": {"executionDomain": "mars"}}})"), std::invalid_argument);
        CHECK_FALSE(wf->hasStep("B"));
    }

    CHECK(wf->queueSize() == 1);
}
