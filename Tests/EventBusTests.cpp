/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/Core/EventBus.h"
#include "TestHelpers.h"
#include <stdexcept>
#include <string>
#include <vector>

using namespace FlowEngine::Core;
using namespace FlowEngine::Core::Testing;

struct Ping {
    int value = 0;
};

SCENARIO("EventBus delivers to topic subscribers", "[eventbus]") {
    GIVEN("A bus with two subscribers on one topic") {
        EventBus<Ping> bus;
        std::vector<int> seen;
        auto first = bus.subscribe("ping", [&](const Ping& p) { seen.push_back(p.value); });
        bus.subscribe("ping", [&](const Ping& p) { seen.push_back(p.value * 10); });

        WHEN("An event is published") {
            bus.publish("ping", Ping{3});

            THEN("Both handlers run in subscription order") {
                REQUIRE(seen == std::vector<int>{3, 30});
            }
        }

        WHEN("Another topic is published") {
            bus.publish("pong", Ping{3});

            THEN("Nobody hears it") {
                REQUIRE(seen.empty());
            }
        }

        WHEN("The first handler unsubscribes") {
            REQUIRE(bus.unsubscribe("ping", first));
            bus.publish("ping", Ping{1});

            THEN("Only the second one runs") {
                REQUIRE(seen == std::vector<int>{10});
                REQUIRE(bus.getSubscriberCount("ping") == 1);
                REQUIRE_FALSE(bus.unsubscribe("ping", first));
            }
        }
    }
}

TEST_CASE("EventBus isolates throwing handlers", "[eventbus]") {
    ScopedLogCapture capture;
    EventBus<Ping> bus;
    int reached = 0;
    bus.subscribe("ping", [](const Ping&) { throw std::runtime_error("boom"); });
    bus.subscribe("ping", [&](const Ping&) { ++reached; });

    REQUIRE_NOTHROW(bus.publish("ping", Ping{}));
    CHECK(reached == 1);
    CHECK(capture.sink().count(Logging::LogLevel::Warning, "EventBus") == 1);
}

TEST_CASE("EventBus handlers may unsubscribe while being called", "[eventbus]") {
    EventBus<Ping> bus;
    int calls = 0;
    EventBus<Ping>::HandlerId self = 0;
    self = bus.subscribe("ping", [&](const Ping&) {
        ++calls;
        bus.unsubscribe("ping", self);
    });

    bus.publish("ping", Ping{});
    bus.publish("ping", Ping{});
    CHECK(calls == 1);
    CHECK_FALSE(bus.hasSubscribers());
    CHECK(bus.getTotalSubscriptions() == 0);
}
