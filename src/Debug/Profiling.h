/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file Profiling.h
 * @brief Tracy zones and plots for the scheduler, executor and bridge
 *
 * With TRACY_ENABLE defined every macro forwards to Tracy. Without it they
 * expand to nothing, so instrumented code costs nothing in normal builds.
 *
 * @code
 * size_t Workflow::pump() {
 *     FLOW_PROFILE_ZONE();
 *     ...
 *     {
 *         FLOW_PROFILE_ZONE_N("Bridge wait");
 *         channel.wait(...);
 *     }
 *     FLOW_PROFILE_PLOT("Workflow queue", static_cast<int64_t>(queueSize));
 * }
 * @endcode
 */

#pragma once

#include <tracy/Tracy.hpp>
#include <cstdint>

#ifdef TRACY_ENABLE
    #define FLOW_PROFILE_ZONE() ZoneScoped
    #define FLOW_PROFILE_ZONE_N(name) ZoneScopedN(name)
    #define FLOW_PROFILE_ZONE_NC(name, color) ZoneScopedNC(name, color)
    #define FLOW_PROFILE_ZONE_TEXT(text, size) ZoneText(text, size)

    #define FLOW_PROFILE_PLOT(name, val) TracyPlot(name, val)

    #define FLOW_PROFILE_MESSAGE(txt, size) TracyMessage(txt, size)
    #define FLOW_PROFILE_MESSAGE_L(txt) TracyMessageL(txt)

    #define FLOW_PROFILE_THREAD_NAME(name) tracy::SetThreadName(name)
#else
    #define FLOW_PROFILE_ZONE()
    #define FLOW_PROFILE_ZONE_N(name)
    #define FLOW_PROFILE_ZONE_NC(name, color)
    #define FLOW_PROFILE_ZONE_TEXT(text, size)

    #define FLOW_PROFILE_PLOT(name, val)

    #define FLOW_PROFILE_MESSAGE(txt, size)
    #define FLOW_PROFILE_MESSAGE_L(txt)

    #define FLOW_PROFILE_THREAD_NAME(name)
#endif

namespace FlowEngine {
namespace Core {
namespace Debug {

    /// Zone colors so scheduler, executor and bridge stand apart in the timeline
    namespace ProfileColors {
        inline constexpr uint32_t Scheduler = 0x4CAF50;
        inline constexpr uint32_t Executor  = 0x2196F3;
        inline constexpr uint32_t Bridge    = 0xFF9800;
        inline constexpr uint32_t Remote    = 0x9C27B0;
        inline constexpr uint32_t Timer     = 0x607D8B;
    }

} // namespace Debug
} // namespace Core
} // namespace FlowEngine
