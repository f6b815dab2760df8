/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file ConsoleSink.h
 * @brief Terminal sink, the default for the global logger
 */

#pragma once

#include "ILogSink.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace FlowEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries as one line each
     *
     * Error and Fatal go to the error stream, everything else to the output
     * stream (stderr and stdout unless given), so redirecting stdout still
     * leaves failures visible. A line looks like
     *
     *   [12:04:31.207] [WARN ] [a1f3] [StepExecutor] <9c1e-4> step 'charge' failed after 3 attempt(s)
     *
     * where <...> is the queue item's trace id when the entry has one.
     */
    class ConsoleSink : public ILogSink {
    public:
        struct Options {
            bool useColor = true;
            bool showThreadId = true;      ///< Tells the pump, timer and remote worker threads apart
            bool showTraceId = true;
            bool showLocation = false;
        };

        ConsoleSink() : ConsoleSink(Options{}) {}
        explicit ConsoleSink(Options options, std::ostream& out = std::cout, std::ostream& err = std::cerr)
            : _options(options)
            , _out(out)
            , _err(err) {}

        void write(const LogEntry& entry) override;
        void flush() override;
        bool shouldLog(LogLevel level) const override;
        void setMinLevel(LogLevel level) override;

        const Options& options() const { return _options; }

        /// The line write() would print, without the trailing newline
        std::string formatLine(const LogEntry& entry) const;

    private:
        const char* colorFor(LogLevel level) const;

        Options _options;
        std::ostream& _out;
        std::ostream& _err;
        mutable std::mutex _mutex;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
