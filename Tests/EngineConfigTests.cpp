/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/Flow/EngineConfig.h"
#include "../src/Flow/WorkflowEngine.h"
#include "../src/Store/MemoryStore.h"
#include "TestHelpers.h"
#include <chrono>
#include <stdexcept>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Flow;
using namespace FlowEngine::Core::Testing;
using namespace std::chrono_literals;

TEST_CASE("An empty config keeps every default", "[config]") {
    auto config = parseEngineConfig("{}");

    CHECK(config.defaults.order == QueueOrder::Fifo);
    CHECK(config.defaults.resumeMode == ResumeMode::Auto);
    CHECK(config.defaults.logSize == DefaultStepLogSize);
    CHECK(config.defaults.budgets.maxSteps == 0);
    CHECK(config.processDomain == ExecutionDomain::Local);
    CHECK(config.enableBridge);
    CHECK(config.bridge.timeout == 15000ms);
    CHECK(config.bridge.callerMayBlock);
    CHECK_FALSE(config.logLevel.has_value());
}

TEST_CASE("Every key is read", "[config]") {
    auto config = parseEngineConfig(R"({
        "order": "dfs",
        "resumeMode": "manual",
        "logSize": 16,
        "enableDebugLogging": true,
        "budgets": {"maxSteps": 50, "maxMillis": 8},
        "processDomain": "remote",
        "enableBridge": false,
        "logLevel": "warn",
        "bridge": {
            "targetUrl": "fx://payments/step",
            "headers": {"authorization": "Bearer abc"},
            "timeoutMs": 250,
            "channelCapacity": 4096,
            "callerMayBlock": false,
            "completionTtlMs": 2000,
            "maxUnclaimedCompletions": 8
        }
    })");

    CHECK(config.defaults.order == QueueOrder::Lifo);
    CHECK(config.defaults.resumeMode == ResumeMode::Manual);
    CHECK(config.defaults.logSize == 16);
    CHECK(config.defaults.enableDebugLogging);
    CHECK(config.defaults.budgets.maxSteps == 50);
    CHECK(config.defaults.budgets.maxMillis == 8);
    CHECK(config.processDomain == ExecutionDomain::Remote);
    CHECK_FALSE(config.enableBridge);
    CHECK(config.logLevel == Logging::LogLevel::Warning);

    CHECK(config.bridge.targetUrl == "fx://payments/step");
    CHECK(config.bridge.headers.size() == 1);
    CHECK(config.bridge.headers.at("authorization") == "Bearer abc");
    CHECK(config.bridge.timeout == 250ms);
    CHECK(config.bridge.channelCapacity == 4096);
    CHECK_FALSE(config.bridge.callerMayBlock);
    CHECK(config.bridge.completionTtl == 2000ms);
    CHECK(config.bridge.maxUnclaimedCompletions == 8);
}

TEST_CASE("Queue order names are case-insensitive and have graph aliases", "[config]") {
    CHECK(parseEngineConfig(R"({"order": "BFS"})").defaults.order == QueueOrder::Fifo);
    CHECK(parseEngineConfig(R"({"order": "lifo"})").defaults.order == QueueOrder::Lifo);
    CHECK(parseQueueOrder("Dfs") == QueueOrder::Lifo);
    CHECK_FALSE(parseQueueOrder("random").has_value());
}

TEST_CASE("An unknown log level name falls back to info", "[config]") {
    CHECK(parseEngineConfig(R"({"logLevel": "chatty"})").logLevel == Logging::LogLevel::Info);
}

TEST_CASE("Bad configs are refused", "[config]") {
    SECTION("Malformed JSON") {
        CHECK_THROWS_AS(parseEngineConfig("{order: fifo"), std::invalid_argument);
    }

    SECTION("Not an object") {
        CHECK_THROWS_AS(parseEngineConfig("[]"), std::invalid_argument);
    }

    SECTION("Unknown enum names") {
        CHECK_THROWS_AS(parseEngineConfig(R"({"order": "sideways"})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"resumeMode": "later"})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"processDomain": "cloud"})"), std::invalid_argument);
    }

    SECTION("An engine cannot live in both domains") {
        CHECK_THROWS_AS(parseEngineConfig(R"({"processDomain": "both"})"), std::invalid_argument);
    }

    SECTION("Wrong types") {
        CHECK_THROWS_AS(parseEngineConfig(R"({"logSize": "big"})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"enableBridge": 1})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"budgets": 5})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"budgets": {"maxSteps": -1}})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"bridge": {"headers": {"x": 1}}})"), std::invalid_argument);
    }

    SECTION("Out of range sizes") {
        CHECK_THROWS_AS(parseEngineConfig(R"({"logSize": 0})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"bridge": {"channelCapacity": 0}})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"bridge": {"channelCapacity": 4294967296}})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"bridge": {"completionTtlMs": 0}})"), std::invalid_argument);
        CHECK_THROWS_AS(parseEngineConfig(R"({"bridge": {"maxUnclaimedCompletions": 0}})"), std::invalid_argument);
    }
}

TEST_CASE("Parsed defaults apply to new workflows", "[config][engine]") {
    Store::MemoryStore store;
    EngineServices services;
    services.timer = std::make_shared<ManualTimerService>();
    WorkflowEngine engine(store, parseEngineConfig(R"({"order": "dfs", "budgets": {"maxSteps": 3}})"), services);

    auto wf = engine.createWorkflow();
    CHECK(wf->config().order == QueueOrder::Lifo);
    CHECK(wf->config().budgets.maxSteps == 3);
    CHECK(engine.getConfig().defaults.order == QueueOrder::Lifo);
}

TEST_CASE("Engines refuse impossible settings", "[config][engine]") {
    Store::MemoryStore store;

    WorkflowEngineConfig both;
    both.processDomain = ExecutionDomain::Both;
    CHECK_THROWS_AS(WorkflowEngine(store, both), std::invalid_argument);

    WorkflowEngine engine(store);
    WorkflowConfig noLog;
    noLog.logSize = 0;
    CHECK_THROWS_AS(engine.createWorkflow("w", noLog), std::invalid_argument);
}

TEST_CASE("Disabling the bridge keeps remote steps in-process", "[config][engine]") {
    Store::MemoryStore store;
    WorkflowEngineConfig config;
    config.enableBridge = false;

    EngineServices services;
    services.timer = std::make_shared<ManualTimerService>();
    services.transport = std::make_shared<ScriptedTransport>(
        [](const std::string&, const std::string&, const Bridge::Headers&) { return std::string(); });
    WorkflowEngine engine(store, config, services);

    CHECK(engine.bridge() == nullptr);
}
