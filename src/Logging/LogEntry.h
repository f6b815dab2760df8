/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file LogEntry.h
 * @brief One log record as handed to every sink
 */

#pragma once

#include "LogLevel.h"
#include <chrono>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>

namespace FlowEngine {
namespace Core {
namespace Logging {

    /**
     * @brief A single log event
     *
     * Carries the formatted message and its context; layout is up to the sink.
     * traceId is set when the line concerns one queue item, so a reader can
     * follow an item from the pump through the bridge and back by grepping for
     * the same id the step:* events carry.
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        std::thread::id threadId;
        LogLevel level;
        std::string category;
        std::string message;
        std::string traceId;        ///< Empty when not tied to a queue item
        std::source_location location;

        LogEntry(LogLevel lvl,
                 std::string_view cat,
                 std::string msg,
                 std::string trace = {},
                 const std::source_location& loc = std::source_location::current())
            : timestamp(std::chrono::system_clock::now())
            , threadId(std::this_thread::get_id())
            , level(lvl)
            , category(cat)
            , message(std::move(msg))
            , traceId(std::move(trace))
            , location(loc) {}

        bool hasTrace() const { return !traceId.empty(); }
    };

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
