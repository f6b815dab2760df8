/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file Logger.h
 * @brief Sink-routing logger and the FLOW_LOG_* macros
 *
 * Every FlowCore subsystem logs through the global Logger under a category
 * ("Workflow", "StepExecutor", "Bridge", "RemoteWorker", "EventBus", "Timer",
 * "Store"). Per-step logs that belong to a workflow instance live in StepLog,
 * not here.
 */

#pragma once

#include "LogEntry.h"
#include "ILogSink.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Fans log entries out to the registered sinks
     *
     * Sinks sit behind a shared mutex, so logging threads (pumps, the remote
     * worker, the retry timer) only contend when sinks are added or removed.
     * The minimum level is checked before an entry is built.
     *
     * Logging happens on paths where failures must not escape (inside a pump,
     * on the bridge's worker). A sink that throws from write() loses that
     * entry; the loss is counted in droppedEntries() and the other sinks still
     * get it.
     *
     * @code
     * Logger logger("Bridge");
     * logger.addSink(std::make_shared<ConsoleSink>());
     * logger.warning("Bridge", std::format("request {} timed out", id));
     * logger.logTraced(LogLevel::Warning, "StepExecutor", item.traceId, "retrying");
     *
     * // Preferred in library code
     * FLOW_LOG_WARNING_TRACE("StepExecutor", item.traceId, std::format("step '{}' failed", name));
     * @endcode
     */
    class Logger {
    private:
        std::string _name;
        std::vector<LogSinkPtr> _sinks;
        mutable std::shared_mutex _sinkMutex;
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
        std::atomic<uint64_t> _dropped{0};

        static Logger* s_globalLogger;
        static std::mutex s_globalMutex;

    public:
        explicit Logger(std::string name) : _name(std::move(name)) {}

        /**
         * @brief Process-wide logger, created on first use with a ConsoleSink
         *
         * Its minimum level starts at Info, or at the level named by the
         * FLOW_LOG_LEVEL environment variable when that is set.
         */
        static Logger& global();

        /**
         * @brief Replace the global logger (takes ownership)
         */
        static void setGlobal(Logger* logger);

        /// Level named by an environment value, nullopt when unset or empty
        static std::optional<LogLevel> levelOverride(const char* value);

        void addSink(LogSinkPtr sink);
        void removeSink(const LogSinkPtr& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel getMinLevel() const { return _minLevel.load(std::memory_order_relaxed); }
        const std::string& getName() const { return _name; }

        bool isEnabled(LogLevel level) const { return level >= getMinLevel() && level != LogLevel::Off; }

        /// Entries lost because a sink threw while writing them
        uint64_t droppedEntries() const { return _dropped.load(std::memory_order_relaxed); }

        void log(LogLevel level,
                 std::string_view category,
                 const std::string& message,
                 const std::source_location& location = std::source_location::current()) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category, message, {}, location));
        }

        /// Logs a line about one queue item, tagged with its trace id
        void logTraced(LogLevel level,
                       std::string_view category,
                       std::string_view traceId,
                       const std::string& message,
                       const std::source_location& location = std::source_location::current()) {
            if (!isEnabled(level)) return;
            writeToSinks(LogEntry(level, category, message, std::string(traceId), location));
        }

        void trace(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Trace, category, message, loc);
        }

        void debug(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Debug, category, message, loc);
        }

        void info(std::string_view category, const std::string& message,
                  const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Info, category, message, loc);
        }

        void warning(std::string_view category, const std::string& message,
                     const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Warning, category, message, loc);
        }

        void error(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Error, category, message, loc);
        }

        void fatal(std::string_view category, const std::string& message,
                   const std::source_location& loc = std::source_location::current()) {
            log(LogLevel::Fatal, category, message, loc);
            flush();
        }

        void flush();

    private:
        void writeToSinks(const LogEntry& entry);
    };

} // namespace Logging
} // namespace Core
} // namespace FlowEngine

/**
 * Global-logger shortcuts. The plain variants use the calling function's
 * name as category; the _CAT variants take an explicit one, and the _TRACE
 * variants also tag the line with a queue item's trace id. Format first,
 * then log:
 *
 * @code
 * FLOW_LOG_DEBUG_CAT("Workflow", std::format("pump '{}' ran {} steps", id, steps));
 * @endcode
 */
#define FLOW_LOG_TRACE(msg) \
    ::FlowEngine::Core::Logging::Logger::global().trace(__func__, msg)

#define FLOW_LOG_DEBUG(msg) \
    ::FlowEngine::Core::Logging::Logger::global().debug(__func__, msg)

#define FLOW_LOG_INFO(msg) \
    ::FlowEngine::Core::Logging::Logger::global().info(__func__, msg)

#define FLOW_LOG_WARNING(msg) \
    ::FlowEngine::Core::Logging::Logger::global().warning(__func__, msg)

#define FLOW_LOG_ERROR(msg) \
    ::FlowEngine::Core::Logging::Logger::global().error(__func__, msg)

#define FLOW_LOG_TRACE_CAT(category, msg) \
    ::FlowEngine::Core::Logging::Logger::global().trace(category, msg)

#define FLOW_LOG_DEBUG_CAT(category, msg) \
    ::FlowEngine::Core::Logging::Logger::global().debug(category, msg)

#define FLOW_LOG_INFO_CAT(category, msg) \
    ::FlowEngine::Core::Logging::Logger::global().info(category, msg)

#define FLOW_LOG_WARNING_CAT(category, msg) \
    ::FlowEngine::Core::Logging::Logger::global().warning(category, msg)

#define FLOW_LOG_ERROR_CAT(category, msg) \
    ::FlowEngine::Core::Logging::Logger::global().error(category, msg)

#define FLOW_LOG_DEBUG_TRACE(category, traceId, msg) \
    ::FlowEngine::Core::Logging::Logger::global().logTraced( \
        ::FlowEngine::Core::Logging::LogLevel::Debug, category, traceId, msg)

#define FLOW_LOG_WARNING_TRACE(category, traceId, msg) \
    ::FlowEngine::Core::Logging::Logger::global().logTraced( \
        ::FlowEngine::Core::Logging::LogLevel::Warning, category, traceId, msg)
