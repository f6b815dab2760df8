/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file ILogSink.h
 * @brief Destination interface for log entries
 */

#pragma once

#include "LogEntry.h"
#include <memory>

namespace FlowEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Where log entries end up
     *
     * Every sink filters on its own minimum level, so a console sink can show
     * warnings only while a capture sink in a test records everything.
     * write() may be called from any thread (pump threads, the bridge's
     * remote worker, the retry timer) and must be thread-safe.
     *
     * @code
     * class CaptureSink : public ILogSink {
     *     std::mutex _mutex;
     *     std::vector<std::string> _lines;
     * public:
     *     void write(const LogEntry& e) override {
     *         std::lock_guard<std::mutex> lock(_mutex);
     *         _lines.push_back(e.message);
     *     }
     *     void flush() override {}
     *     bool shouldLog(LogLevel) const override { return true; }
     *     void setMinLevel(LogLevel) override {}
     * };
     * @endcode
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        /// Output one entry. Must be thread-safe.
        virtual void write(const LogEntry& entry) = 0;

        /// Push out anything buffered. Called after Error/Fatal entries.
        virtual void flush() = 0;

        /// Whether this sink wants entries of the given level
        virtual bool shouldLog(LogLevel level) const = 0;

        /// Minimum level this sink accepts (inclusive)
        virtual void setMinLevel(LogLevel level) = 0;
    };

    using LogSinkPtr = std::shared_ptr<ILogSink>;

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
