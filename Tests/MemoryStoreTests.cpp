/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/Store/MemoryStore.h"
#include "../src/Store/JsonSnapshotCodec.h"
#include "TestHelpers.h"
#include <format>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Store;
using namespace FlowEngine::Core::Testing;

SCENARIO("Resolving store paths", "[store]") {
    GIVEN("An empty store") {
        MemoryStore store;

        WHEN("A dotted path is resolved") {
            auto node = store.resolve("flows.a.nodes.step");

            THEN("Every segment becomes a node") {
                REQUIRE(node != InvalidNode);
                REQUIRE(store.pathOf(node) == "flows.a.nodes.step");
                REQUIRE(store.nodeCount() == 5); // root + 4 segments
                REQUIRE(store.resolve("flows.a.nodes.step") == node);
            }

            AND_WHEN("A sibling is looked up without creating") {
                auto missing = store.resolve("flows.a.nodes.other", false);

                THEN("Nothing is created") {
                    REQUIRE(missing == InvalidNode);
                    REQUIRE(store.nodeCount() == 5);
                }
            }

            AND_WHEN("A child is added through its parent") {
                auto parent = store.resolve("flows.a.nodes");
                auto child = store.child(parent, "other");

                THEN("It resolves by path as well") {
                    REQUIRE(store.resolve("flows.a.nodes.other", false) == child);
                }
            }
        }

        THEN("Bad paths and names are rejected") {
            REQUIRE_THROWS_AS(store.resolve("a..b"), std::invalid_argument);
            REQUIRE_THROWS_AS(store.child(store.root(), "x.y"), std::invalid_argument);
            REQUIRE_THROWS_AS(store.get(9999), std::out_of_range);
        }
    }
}

SCENARIO("Watching store nodes", "[store]") {
    GIVEN("A node with one watcher") {
        MemoryStore store;
        auto node = store.resolve("counter");
        std::vector<std::pair<Value, Value>> changes;
        auto watchId = store.watch(node, [&](const Value& now, const Value& before) {
            changes.emplace_back(now, before);
        });

        WHEN("The value changes") {
            REQUIRE(store.set(node, 1));
            REQUIRE(store.set(node, 2));

            THEN("The watcher sees new and old values") {
                REQUIRE(changes.size() == 2);
                REQUIRE(changes[0].first == Value(1));
                REQUIRE(changes[0].second.isNull());
                REQUIRE(changes[1].first == Value(2));
                REQUIRE(changes[1].second == Value(1));
            }
        }

        WHEN("An equal value is written") {
            store.set(node, 5);
            bool changed = store.set(node, 5);

            THEN("Nothing fires the second time") {
                REQUIRE_FALSE(changed);
                REQUIRE(changes.size() == 1);
            }
        }

        WHEN("A value of another type but the same number is written") {
            store.set(node, 1);
            bool changed = store.set(node, 1.0);

            THEN("It counts as a change") {
                REQUIRE(changed);
                REQUIRE(changes.size() == 2);
            }
        }

        WHEN("The watcher is removed") {
            REQUIRE(store.unwatch(watchId));
            store.set(node, 3);

            THEN("It no longer hears changes") {
                REQUIRE(changes.empty());
                REQUIRE(store.watcherCount(node) == 0);
                REQUIRE_FALSE(store.unwatch(watchId));
            }
        }
    }
}

TEST_CASE("Store watchers can write the store", "[store]") {
    MemoryStore store;
    auto source = store.resolve("source");
    auto mirror = store.resolve("mirror");
    store.watch(source, [&](const Value& now, const Value&) {
        store.set(mirror, now);
    });

    store.set(source, "hello");
    CHECK(store.get(mirror) == Value("hello"));
}

TEST_CASE("A throwing watcher does not stop the others", "[store]") {
    ScopedLogCapture capture;
    MemoryStore store;
    auto node = store.resolve("x");
    int reached = 0;
    store.watch(node, [](const Value&, const Value&) { throw std::runtime_error("bad watcher"); });
    store.watch(node, [&](const Value&, const Value&) { ++reached; });

    REQUIRE(store.set(node, 1));
    CHECK(reached == 1);
    CHECK(capture.sink().count(Logging::LogLevel::Warning, "Store") == 1);
}

TEST_CASE("Concurrent writers to separate nodes", "[store][threading]") {
    MemoryStore store;
    constexpr int writers = 4;
    constexpr int writes = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < writers; ++t) {
        threads.emplace_back([&store, t]() {
            auto node = store.resolve(std::format("w.{}", t));
            for (int i = 1; i <= writes; ++i) {
                store.set(node, i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < writers; ++t) {
        CHECK(store.get(store.resolve(std::format("w.{}", t))) == Value(writes));
    }
}

TEST_CASE("JsonSnapshotCodec", "[store][json]") {
    JsonSnapshotCodec codec;

    Value snapshot;
    snapshot["id"] = "wf";
    snapshot["queue"] = Value::Array{Value(1)};
    CHECK(codec.decode(codec.encode(snapshot)) == snapshot);

    CHECK_THROWS_AS(codec.decode("[1,2]"), std::invalid_argument);
    CHECK_THROWS_AS(codec.decode("{oops"), std::invalid_argument);
}
