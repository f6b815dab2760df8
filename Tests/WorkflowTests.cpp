/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/Flow/WorkflowEngine.h"
#include "../src/Store/MemoryStore.h"
#include "TestHelpers.h"
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Flow;
using namespace FlowEngine::Core::Testing;

namespace {

    EngineServices manualServices(std::shared_ptr<ManualTimerService> timer) {
        EngineServices services;
        services.timer = std::move(timer);
        return services;
    }

    StepDefinition effectStep(EffectFn effect, std::vector<std::string> next = {}) {
        StepDefinition def;
        def.effect = std::move(effect);
        def.staticNext = std::move(next);
        return def;
    }

    /// Records the step names of every step:after event of a workflow
    struct AfterRecorder {
        std::vector<std::string> steps;
        std::vector<Value> outputs;

        Workflow::Unsubscribe attach(Workflow& wf) {
            return wf.on(Events::StepAfter, [this](const WorkflowEvent& e) {
                steps.push_back(e.stepName);
                outputs.push_back(e.output);
            });
        }
    };

}

SCENARIO("A two step chain runs to completion", "[workflow][scheduler]") {
    GIVEN("A doubles its input and feeds B, which adds one") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        auto wf = engine.createWorkflow("pricing");

        wf->defineStep("A", effectStep([](StepContext& ctx) { return Value(ctx.input().asInt() * 2); }, {"B"}));
        wf->defineStep("B", effectStep([](StepContext& ctx) { return Value(ctx.input().asInt() + 1); }));

        AfterRecorder after;
        auto unsubscribe = after.attach(*wf);

        std::vector<std::string> lifecycle;
        wf->on(Events::WorkflowStart, [&](const WorkflowEvent& e) { lifecycle.push_back(e.topic); });
        wf->on(Events::WorkflowIdle, [&](const WorkflowEvent& e) { lifecycle.push_back(e.topic); });
        wf->on(Events::WorkflowFinish, [&](const WorkflowEvent& e) { lifecycle.push_back(e.topic); });

        WHEN("It is started with 3") {
            wf->start("A", 3);

            THEN("A produced 6 and B produced 7, in that order") {
                REQUIRE(after.steps == std::vector<std::string>{"A", "B"});
                REQUIRE(after.outputs == std::vector<Value>{Value(6), Value(7)});
                REQUIRE(wf->output("A") == Value(6));
                REQUIRE(wf->output("B") == Value(7));
            }

            THEN("The pump reported start, idle and finish") {
                REQUIRE(lifecycle == std::vector<std::string>{"workflow:start", "workflow:idle", "workflow:finish"});
            }

            THEN("Stats count both steps and the queue is drained") {
                auto stats = wf->getStats();
                REQUIRE(stats.steps == 2);
                REQUIRE(stats.failures == 0);
                REQUIRE(wf->queueSize() == 0);
                REQUIRE_FALSE(wf->isRunning());
            }
        }

        WHEN("The step:after subscription is removed before starting") {
            unsubscribe();
            wf->start("A", 3);

            THEN("No step:after events are recorded") {
                REQUIRE(after.steps.empty());
            }
        }

        THEN("Starting an unknown step is refused") {
            REQUIRE_THROWS_AS(wf->start("nope"), std::invalid_argument);
        }
    }
}

TEST_CASE("Queue order decides breadth or depth first", "[workflow][scheduler]") {
    auto runWithOrder = [](QueueOrder order) {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        WorkflowConfig config;
        config.order = order;
        auto wf = engine.createWorkflow("order", config);

        auto pass = [](StepContext& ctx) { return ctx.input(); };
        wf->defineStep("root", effectStep(pass, {"L", "R"}));
        wf->defineStep("L", effectStep(pass, {"L2"}));
        wf->defineStep("R", effectStep(pass));
        wf->defineStep("L2", effectStep(pass));

        AfterRecorder after;
        after.attach(*wf);
        wf->start("root");
        return after.steps;
    };

    SECTION("FIFO") {
        CHECK(runWithOrder(QueueOrder::Fifo) == std::vector<std::string>{"root", "L", "R", "L2"});
    }

    SECTION("LIFO") {
        CHECK(runWithOrder(QueueOrder::Lifo) == std::vector<std::string>{"root", "R", "L", "L2"});
    }
}

SCENARIO("Pump budgets yield with work left in the queue", "[workflow][budget]") {
    GIVEN("A four step chain and a two step budget") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        WorkflowConfig config;
        config.budgets.maxSteps = 2;
        auto wf = engine.createWorkflow("budgeted", config);

        auto inc = [](StepContext& ctx) { return Value(ctx.input().asInt() + 1); };
        wf->defineStep("A", effectStep(inc, {"B"}));
        wf->defineStep("B", effectStep(inc, {"C"}));
        wf->defineStep("C", effectStep(inc, {"D"}));
        wf->defineStep("D", effectStep(inc));

        bool finished = false;
        wf->on(Events::WorkflowFinish, [&](const WorkflowEvent&) { finished = true; });

        WHEN("It is started") {
            wf->start("A", 0);

            THEN("Only two steps ran and C waits in the queue") {
                REQUIRE(wf->getStats().steps == 2);
                REQUIRE(wf->queueSize() == 1);
                REQUIRE(wf->queueSnapshot().front().stepName == "C");
                REQUIRE_FALSE(finished);
            }

            AND_WHEN("The host pumps again") {
                auto ran = wf->pump();

                THEN("The rest of the chain completes") {
                    REQUIRE(ran == 2);
                    REQUIRE(wf->output("D") == Value(4));
                    REQUIRE(finished);
                }
            }
        }
    }

    GIVEN("A three step budget and work that keeps arriving between passes") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        WorkflowConfig config;
        config.budgets.maxSteps = 3;
        config.resumeMode = ResumeMode::Auto;
        auto wf = engine.createWorkflow("refilled", config);

        int runs = 0;
        wf->defineStep("tick", effectStep([&](StepContext& ctx) { ++runs; return ctx.input(); }));

        // Each pass drains the queue, then more work shows up before the pump returns
        int refills = 0;
        wf->on(Events::WorkflowIdle, [&](const WorkflowEvent&) {
            if (refills < 5) {
                ++refills;
                wf->enqueue("tick");
            }
        });

        WHEN("It is started") {
            wf->start("tick");

            THEN("The one pump call stops at the budget") {
                REQUIRE(runs == 3);
                REQUIRE(wf->getStats().steps == 3);
                REQUIRE(wf->queueSize() == 1);
            }

            AND_WHEN("The host pumps again") {
                auto ran = wf->pump();

                THEN("That call gets a budget of its own") {
                    REQUIRE(ran == 3);
                    REQUIRE(runs == 6);
                    REQUIRE(wf->queueSize() == 0);
                }
            }
        }
    }

    GIVEN("A time budget shorter than one step") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        WorkflowConfig config;
        config.budgets.maxMillis = 5;
        auto wf = engine.createWorkflow("slow", config);

        auto slow = [](StepContext& ctx) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return ctx.input();
        };
        wf->defineStep("A", effectStep(slow, {"B"}));
        wf->defineStep("B", effectStep(slow));

        WHEN("It is started") {
            wf->start("A");

            THEN("The pump stops after the first step") {
                REQUIRE(wf->getStats().steps == 1);
                REQUIRE(wf->queueSize() == 1);
            }
        }
    }
}

TEST_CASE("runSync resets the step counter before pumping", "[workflow][scheduler]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("sync");
    wf->defineStep("A", effectStep([](StepContext& ctx) { return ctx.input(); }));

    wf->start("A");
    wf->start("A");
    REQUIRE(wf->getStats().steps == 2);

    wf->enqueue("A", 1);
    CHECK(wf->runSync() == 1);
    CHECK(wf->getStats().steps == 1);
}

TEST_CASE("A pump issued while pumping does nothing", "[workflow][scheduler][reentrancy]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("reentrant");
    Workflow* raw = wf.get();

    size_t nestedRan = 99;
    size_t sizeBefore = 0;
    size_t sizeAfter = 0;
    wf->defineStep("A", effectStep([&](StepContext& ctx) {
        ctx.enqueueNext("B");
        sizeBefore = raw->queueSize();
        nestedRan = raw->pump();
        sizeAfter = raw->queueSize();
        return Value();
    }));
    wf->defineStep("B", effectStep([](StepContext&) { return Value("b"); }));

    wf->start("A");

    CHECK(nestedRan == 0);
    CHECK(sizeBefore == sizeAfter);
    CHECK(wf->output("B") == Value("b"));
    CHECK(wf->getStats().steps == 2);
}

SCENARIO("Steps re-run when their store node changes", "[workflow][store]") {
    GIVEN("A counter that writes itself until it reaches 3") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        auto wf = engine.createWorkflow("counter");

        std::vector<int64_t> seen;
        wf->defineStep("count", effectStep([&](StepContext& ctx) {
            int64_t v = ctx.input().isNull() ? 0 : ctx.input().asInt();
            seen.push_back(v);
            if (v < 3) {
                ctx.writeSelf(v + 1);
            }
            return Value(v);
        }));

        WHEN("It is started") {
            wf->start("count", 0);

            THEN("It runs once per distinct value and then settles") {
                REQUIRE(seen == std::vector<int64_t>{0, 1, 2, 3});
                REQUIRE(wf->value("count") == Value(3));
                REQUIRE(wf->queueSize() == 0);
            }

            AND_WHEN("The node is written with the value it already has") {
                bool changed = wf->set("count", 3);

                THEN("Nothing is enqueued") {
                    REQUIRE_FALSE(changed);
                    REQUIRE(seen.size() == 4);
                }
            }

            AND_WHEN("The node is written from outside with a new value") {
                wf->set("count", 10);

                THEN("The step runs once more with that value") {
                    REQUIRE(seen.back() == 10);
                    REQUIRE(seen.size() == 5);
                }
            }
        }

        THEN("The backing node lives under the workflow's path") {
            REQUIRE(wf->nodePath("count") == "flows.counter.nodes.count");
            REQUIRE(wf->outputPath("count") == "flows.counter.outputs.count");
        }
    }
}

TEST_CASE("Explicit enqueues replace static next", "[workflow][scheduler]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("explicit");

    wf->defineStep("A", effectStep([](StepContext& ctx) {
        ctx.enqueueNext("C", "picked");
        return Value("a");
    }, {"B"}));
    wf->defineStep("B", effectStep([](StepContext&) { return Value("b"); }));
    wf->defineStep("C", effectStep([](StepContext& ctx) { return ctx.input(); }));

    AfterRecorder after;
    after.attach(*wf);
    wf->start("A");

    CHECK(after.steps == std::vector<std::string>{"A", "C"});
    CHECK(wf->output("C") == Value("picked"));
}

TEST_CASE("Edges and static next merge without duplicates", "[workflow][scheduler]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("edges");

    int bRuns = 0;
    wf->defineStep("A", effectStep([](StepContext&) { return Value(1); }, {"B"}));
    wf->defineStep("B", effectStep([&](StepContext&) { ++bRuns; return Value(2); }));
    wf->defineStep("C", effectStep([](StepContext& ctx) { return ctx.input(); }));
    wf->connect("A", {"B", "C"});

    wf->start("A");

    CHECK(bRuns == 1);
    CHECK(wf->output("C") == Value(1));
}

TEST_CASE("Steps share the instance scratch map", "[workflow]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("shared");

    wf->defineStep("write", effectStep([](StepContext& ctx) {
        ctx.shared()["token"] = "abc";
        return Value();
    }, {"read"}));
    wf->defineStep("read", effectStep([](StepContext& ctx) { return ctx.shared()["token"]; }));

    wf->start("write");
    CHECK(wf->output("read") == Value("abc"));
    CHECK(wf->shared().at("token") == Value("abc"));
}

TEST_CASE("Instance subscriptions only see their own events", "[workflow][events]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto first = engine.createWorkflow("first");
    auto second = engine.createWorkflow("second");
    for (auto& wf : {first, second}) {
        wf->defineStep("S", effectStep([](StepContext& ctx) { return ctx.input(); }));
    }

    std::vector<std::string> firstSaw;
    std::vector<std::string> engineSaw;
    first->on(Events::StepAfter, [&](const WorkflowEvent& e) { firstSaw.push_back(e.instanceId); });
    engine.on(Events::StepAfter, [&](const WorkflowEvent& e) { engineSaw.push_back(e.instanceId); });

    int namedHits = 0;
    first->on(Events::stepBefore("S"), [&](const WorkflowEvent& e) {
        ++namedHits;
        CHECK(e.stepName == "S");
        CHECK_FALSE(e.traceId.empty());
    });

    first->start("S", 1);
    second->start("S", 2);

    CHECK(firstSaw == std::vector<std::string>{"first"});
    CHECK(engineSaw == std::vector<std::string>{"first", "second"});
    CHECK(namedHits == 1);
}

TEST_CASE("Trace ids are kept along a chain unless given", "[workflow]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
    auto wf = engine.createWorkflow("trace");
    wf->defineStep("A", effectStep([](StepContext& ctx) { return ctx.input(); }, {"B"}));
    wf->defineStep("B", effectStep([](StepContext& ctx) { return Value(ctx.traceId()); }));

    auto traceId = wf->enqueue("A", 1, "trace-7");
    wf->pump();
    CHECK(traceId == "trace-7");
    CHECK(wf->output("B") == Value("trace-7"));

    auto generated = wf->enqueue("A", 2);
    CHECK_FALSE(generated.empty());
    CHECK(generated != wf->enqueue("A", 3));
}

TEST_CASE("Engine bookkeeping", "[workflow][engine]") {
    Store::MemoryStore store;
    WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));

    auto a = engine.createWorkflow();
    auto b = engine.createWorkflow();
    CHECK(a->id() == "flow_1");
    CHECK(b->id() == "flow_2");
    CHECK_THROWS_AS(engine.createWorkflow("flow_1"), std::invalid_argument);

    CHECK(engine.findWorkflow("flow_2") == b);
    CHECK(engine.workflowIds() == std::vector<std::string>{"flow_1", "flow_2"});
    CHECK(engine.removeWorkflow("flow_1"));
    CHECK_FALSE(engine.removeWorkflow("flow_1"));
    CHECK(engine.findWorkflow("flow_1") == nullptr);
    CHECK(engine.bridge() == nullptr);
}

SCENARIO("Steps can spawn sub-workflows", "[workflow][subflow]") {
    GIVEN("A parent whose step builds and starts a child") {
        Store::MemoryStore store;
        WorkflowEngine engine(store, {}, manualServices(std::make_shared<ManualTimerService>()));
        auto parent = engine.createWorkflow("order");

        parent->defineStep("fanout", effectStep([](StepContext& ctx) {
            auto child = ctx.spawnSubWorkflow("shipping",
                [](Workflow& wf) {
                    StepDefinition pack;
                    pack.effect = [](StepContext& c) { return Value(c.input().asInt() + 100); };
                    wf.defineStep("pack", pack);
                },
                SubWorkflowStart{"pack", ctx.input()});
            return Value(child->id());
        }));

        WHEN("The parent runs") {
            parent->start("fanout", 5);

            THEN("The child exists under the parent's id and has run") {
                auto child = engine.findWorkflow("order.subflows.shipping");
                REQUIRE(child != nullptr);
                REQUIRE(parent->output("fanout") == Value("order.subflows.shipping"));
                REQUIRE(child->output("pack") == Value(105));
            }
        }

        WHEN("A child is only planned") {
            std::shared_ptr<Workflow> planned;
            parent->defineStep("plan", effectStep([&](StepContext& ctx) {
                planned = ctx.planSubWorkflow("later", [](Workflow& wf) {
                    wf.defineStep("idle", StepDefinition{});
                });
                return Value();
            }));
            parent->start("plan");

            THEN("It is built but nothing ran") {
                REQUIRE(planned != nullptr);
                REQUIRE(planned->hasStep("idle"));
                REQUIRE(planned->getStats().steps == 0);
            }
        }
    }
}
