/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "Logger.h"
#include "ConsoleSink.h"
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace FlowEngine {
namespace Core {
namespace Logging {

    Logger* Logger::s_globalLogger = nullptr;
    std::mutex Logger::s_globalMutex;

    Logger& Logger::global() {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        if (!s_globalLogger) {
            s_globalLogger = new Logger("Global");
            s_globalLogger->setMinLevel(levelOverride(std::getenv("FLOW_LOG_LEVEL")).value_or(LogLevel::Info));
            s_globalLogger->addSink(std::make_shared<ConsoleSink>());
        }
        return *s_globalLogger;
    }

    void Logger::setGlobal(Logger* logger) {
        std::lock_guard<std::mutex> lock(s_globalMutex);
        if (s_globalLogger && s_globalLogger != logger) {
            delete s_globalLogger;
        }
        s_globalLogger = logger;
    }

    std::optional<LogLevel> Logger::levelOverride(const char* value) {
        if (!value || *value == '\0') {
            return std::nullopt;
        }
        return stringToLogLevel(value);
    }

    void Logger::addSink(LogSinkPtr sink) {
        if (!sink) return;
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.push_back(std::move(sink));
    }

    void Logger::removeSink(const LogSinkPtr& sink) {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
    }

    void Logger::clearSinks() {
        std::unique_lock<std::shared_mutex> lock(_sinkMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        return _sinks.size();
    }

    void Logger::flush() {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);
        for (auto& sink : _sinks) {
            sink->flush();
        }
    }

    void Logger::writeToSinks(const LogEntry& entry) {
        std::shared_lock<std::shared_mutex> lock(_sinkMutex);

        for (auto& sink : _sinks) {
            if (!sink->shouldLog(entry.level)) continue;
            try {
                sink->write(entry);
            } catch (const std::exception& e) {
                // Only the first loss is reported; after that the counter tells the story
                if (_dropped.fetch_add(1, std::memory_order_relaxed) == 0) {
                    std::cerr << "[" << _name << "] log sink failed, entries will be dropped: " << e.what() << '\n';
                }
            }
        }

        if (entry.level >= LogLevel::Error) {
            for (auto& sink : _sinks) {
                sink->flush();
            }
        }
    }

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
