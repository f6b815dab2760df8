/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "ConsoleSink.h"
#include <ctime>
#include <format>
#include <sstream>

namespace FlowEngine {
namespace Core {
namespace Logging {

namespace {

    constexpr const char* Reset = "\033[0m";

    std::string shortThreadId(std::thread::id id) {
        std::ostringstream text;
        text << id;
        auto full = text.str();
        return full.length() > 4 ? full.substr(full.length() - 4) : full;
    }

} // namespace

    void ConsoleSink::write(const LogEntry& entry) {
        if (!shouldLog(entry.level)) return;

        auto line = formatLine(entry);
        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = entry.level >= LogLevel::Error ? _err : _out;
        stream << line << '\n';
    }

    void ConsoleSink::flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        _out.flush();
        _err.flush();
    }

    bool ConsoleSink::shouldLog(LogLevel level) const {
        return level >= _minLevel.load(std::memory_order_relaxed);
    }

    void ConsoleSink::setMinLevel(LogLevel level) {
        _minLevel.store(level, std::memory_order_relaxed);
    }

    const char* ConsoleSink::colorFor(LogLevel level) const {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Info:    return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:   return "\033[31m";
            case LogLevel::Fatal:   return "\033[35m";
            default:                return Reset;
        }
    }

    std::string ConsoleSink::formatLine(const LogEntry& entry) const {
        auto seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::string line = std::format("[{:02}:{:02}:{:02}.{:03}] ",
                                       local.tm_hour, local.tm_min, local.tm_sec, ms);

        if (_options.useColor) {
            line += std::format("{}[{}]{} ", colorFor(entry.level), logLevelToString(entry.level), Reset);
        } else {
            line += std::format("[{}] ", logLevelToString(entry.level));
        }

        if (_options.showThreadId) {
            line += std::format("[{:>4}] ", shortThreadId(entry.threadId));
        }
        if (!entry.category.empty()) {
            line += std::format("[{}] ", entry.category);
        }
        if (_options.showTraceId && entry.hasTrace()) {
            line += std::format("<{}> ", entry.traceId);
        }

        line += entry.message;

        if (_options.showLocation && entry.location.line() != 0) {
            line += std::format(" ({}:{})", entry.location.file_name(), entry.location.line());
        }
        return line;
    }

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
