/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/Flow/WorkflowEngine.h"
#include "../src/Logging/ConsoleSink.h"
#include "../src/Logging/Logger.h"
#include "../src/Logging/LogLevel.h"
#include "../src/Store/MemoryStore.h"
#include "TestHelpers.h"
#include <cstdio>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Logging;
using FlowEngine::Core::Testing::CaptureSink;
using FlowEngine::Core::Testing::ScopedLogCapture;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;

namespace {

    class ThrowingSink : public ILogSink {
    public:
        void write(const LogEntry&) override { throw std::runtime_error("disk full"); }
        void flush() override {}
        bool shouldLog(LogLevel) const override { return true; }
        void setMinLevel(LogLevel) override {}
    };

    ConsoleSink::Options plainOptions() {
        ConsoleSink::Options options;
        options.useColor = false;
        options.showThreadId = false;
        return options;
    }

}

TEST_CASE("LogLevel conversions", "[logging]") {
    SECTION("Names parse case-insensitively") {
        CHECK(stringToLogLevel("trace") == LogLevel::Trace);
        CHECK(stringToLogLevel("DEBUG") == LogLevel::Debug);
        CHECK(stringToLogLevel("Warn") == LogLevel::Warning);
        CHECK(stringToLogLevel("warning") == LogLevel::Warning);
        CHECK(stringToLogLevel("Off") == LogLevel::Off);
        CHECK(stringToLogLevel("loud") == LogLevel::Info);
    }

    SECTION("Console names are five characters wide") {
        CHECK(logLevelToString(LogLevel::Info) == "INFO ");
        CHECK(logLevelToString(LogLevel::Warning) == "WARN ");
        CHECK(logLevelToString(LogLevel::Error) == "ERROR");
    }

    SECTION("Environment overrides") {
        CHECK_FALSE(Logger::levelOverride(nullptr).has_value());
        CHECK_FALSE(Logger::levelOverride("").has_value());
        CHECK(Logger::levelOverride("debug") == LogLevel::Debug);
    }
}

TEST_CASE("Entries reach sinks that want them", "[logging]") {
    Logger logger("Test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);

    SECTION("Every level helper") {
        logger.trace("Workflow", "queue moved");
        logger.debug("StepExecutor", "guard vetoed");
        logger.info("Engine", "ready");
        logger.warning("Bridge", "fell back");
        logger.error("Workflow", "escaped");
        logger.fatal("Engine", "gone");

        auto entries = sink->entries();
        REQUIRE(entries.size() == 6);
        CHECK(entries[0].level == LogLevel::Trace);
        CHECK(entries[3].category == "Bridge");
        CHECK(entries[3].message == "fell back");
        CHECK(entries[5].level == LogLevel::Fatal);
    }

    SECTION("The logger's minimum level") {
        logger.setMinLevel(LogLevel::Warning);
        logger.info("Engine", "hidden");
        logger.warning("Bridge", "shown");

        auto entries = sink->entries();
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].message == "shown");
    }

    SECTION("A sink's own minimum level") {
        sink->setMinLevel(LogLevel::Info);
        logger.debug("Engine", "hidden");
        logger.info("Engine", "shown");

        REQUIRE(sink->entries().size() == 1);
    }

    SECTION("Removing and clearing sinks") {
        auto other = std::make_shared<CaptureSink>();
        logger.addSink(other);
        CHECK(logger.sinkCount() == 2);

        logger.removeSink(other);
        logger.info("Engine", "one");
        CHECK(other->entries().empty());

        logger.clearSinks();
        logger.info("Engine", "none");
        CHECK(sink->entries().size() == 1);
    }
}

TEST_CASE("Traced entries carry the queue item's trace id", "[logging]") {
    Logger logger("Test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);

    logger.logTraced(LogLevel::Warning, "StepExecutor", "9c1e-4", "step 'charge' failed");
    logger.warning("StepExecutor", "untraced");

    auto entries = sink->entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].traceId == "9c1e-4");
    CHECK(entries[1].traceId.empty());
}

TEST_CASE("A throwing sink does not stop the others", "[logging]") {
    Logger logger("Test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(std::make_shared<ThrowingSink>());
    logger.addSink(sink);

    logger.info("Workflow", "first");
    logger.info("Workflow", "second");

    CHECK(sink->entries().size() == 2);
    CHECK(logger.droppedEntries() == 2);
}

TEST_CASE("Console lines", "[logging][console]") {
    std::ostringstream out;
    std::ostringstream err;
    auto console = std::make_shared<ConsoleSink>(plainOptions(), out, err);

    Logger logger("Test");
    logger.addSink(console);

    SECTION("Level, category, trace id and message") {
        logger.logTraced(LogLevel::Warning, "Bridge", "a1-7", "running in-process");

        auto text = out.str();
        CHECK_THAT(text, ContainsSubstring("[WARN ] [Bridge] <a1-7> running in-process"));
        CHECK_THAT(text, EndsWith("\n"));
        CHECK(err.str().empty());
    }

    SECTION("Errors go to the error stream") {
        logger.error("Workflow", "step escaped the executor");
        CHECK(out.str().empty());
        CHECK_THAT(err.str(), ContainsSubstring("[ERROR] [Workflow] step escaped the executor"));
    }

    SECTION("Trace ids can be hidden") {
        auto options = plainOptions();
        options.showTraceId = false;
        ConsoleSink quiet(options, out, err);
        auto line = quiet.formatLine(LogEntry(LogLevel::Info, "Remote", "served", "t1"));
        CHECK_THAT(line, EndsWith("[INFO ] [Remote] served"));
    }

    SECTION("Colored output wraps the level") {
        auto options = plainOptions();
        options.useColor = true;
        ConsoleSink colored(options, out, err);
        auto line = colored.formatLine(LogEntry(LogLevel::Error, "Bridge", "protocol"));
        CHECK_THAT(line, ContainsSubstring("\033[31m[ERROR]\033[0m"));
    }
}

TEST_CASE("Concurrent logging loses nothing", "[logging]") {
    Logger logger("Test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);

    const int threadCount = 8;
    const int perThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < perThread; ++i) {
                logger.logTraced(LogLevel::Info, "Workflow", std::format("{}-{}", t, i), "pumped");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto entries = sink->entries();
    REQUIRE(entries.size() == threadCount * perThread);

    std::vector<std::vector<bool>> seen(threadCount, std::vector<bool>(perThread, false));
    for (const auto& entry : entries) {
        int t = -1;
        int i = -1;
        REQUIRE(std::sscanf(entry.traceId.c_str(), "%d-%d", &t, &i) == 2);
        REQUIRE(t >= 0);
        REQUIRE(t < threadCount);
        REQUIRE(i >= 0);
        REQUIRE(i < perThread);
        CHECK_FALSE(seen[t][i]);
        seen[t][i] = true;
    }
}

TEST_CASE("Macros write to the global logger", "[logging]") {
    ScopedLogCapture capture;

    FLOW_LOG_INFO("macro message");
    FLOW_LOG_INFO_CAT("Engine", "category message");
    FLOW_LOG_WARNING_TRACE("StepExecutor", "t-42", "traced message");

    auto entries = capture.sink().entries();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].message == "macro message");
    CHECK(entries[1].category == "Engine");
    CHECK(entries[2].traceId == "t-42");
    CHECK(entries[2].level == LogLevel::Warning);
}

TEST_CASE("Step failures are logged with their trace id", "[logging][workflow]") {
    Store::MemoryStore store;
    Flow::EngineServices services;
    services.timer = std::make_shared<Testing::ManualTimerService>();
    Flow::WorkflowEngine engine(store, {}, services);
    auto wf = engine.createWorkflow("traced");

    Flow::StepDefinition def;
    def.effect = [](Flow::StepContext&) -> Value { throw std::runtime_error("boom"); };
    wf->defineStep("explode", def);

    ScopedLogCapture capture;
    wf->enqueue("explode", Value(), "trace-77");
    wf->pump();

    bool found = false;
    for (const auto& entry : capture.sink().entries()) {
        if (entry.level == LogLevel::Warning && entry.category == "StepExecutor") {
            CHECK(entry.traceId == "trace-77");
            CHECK_THAT(entry.message, ContainsSubstring("boom"));
            found = true;
        }
    }
    CHECK(found);
}
