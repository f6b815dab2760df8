/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "../src/Bridge/IRemoteTransport.h"
#include "../src/Flow/TimerService.h"
#include "../src/Logging/Logger.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Testing {

/**
 * @brief Timer that only fires when the test says so
 *
 * Records every requested delay so backoff schedules can be checked exactly,
 * and runs the tasks on the calling thread.
 */
class ManualTimerService : public Flow::ITimerService {
public:
    void schedule(std::chrono::milliseconds delay, Task task) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _delays.push_back(delay);
        _tasks.push_back(std::move(task));
    }

    size_t pendingCount() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _tasks.size();
    }

    /// Runs the tasks queued so far (not ones they schedule); returns how many ran
    size_t fireAll() {
        std::vector<Task> tasks;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            tasks.swap(_tasks);
        }
        for (auto& task : tasks) {
            task();
        }
        return tasks.size();
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _delays;
    }

private:
    mutable std::mutex _mutex;
    std::vector<Task> _tasks;
    std::vector<std::chrono::milliseconds> _delays;
};

/// Log sink that keeps everything it is given
class CaptureSink : public Logging::ILogSink {
public:
    struct Captured {
        Logging::LogLevel level;
        std::string category;
        std::string message;
        std::string traceId;
    };

    void write(const Logging::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back({entry.level, entry.category, entry.message, entry.traceId});
    }

    void flush() override {}

    bool shouldLog(Logging::LogLevel level) const override { return level >= _minLevel; }

    void setMinLevel(Logging::LogLevel level) override { _minLevel = level; }

    std::vector<Captured> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

    size_t count(Logging::LogLevel level, const std::string& category) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for (const auto& e : _entries) {
            if (e.level == level && e.category == category) ++n;
        }
        return n;
    }

private:
    mutable std::mutex _mutex;
    std::vector<Captured> _entries;
    Logging::LogLevel _minLevel = Logging::LogLevel::Trace;
};

/**
 * @brief Routes the global logger into a CaptureSink for one scope
 */
class ScopedLogCapture {
public:
    ScopedLogCapture()
        : _sink(std::make_shared<CaptureSink>())
        , _previousLevel(Logging::Logger::global().getMinLevel()) {
        Logging::Logger::global().setMinLevel(Logging::LogLevel::Trace);
        Logging::Logger::global().addSink(_sink);
    }

    ~ScopedLogCapture() {
        Logging::Logger::global().removeSink(_sink);
        Logging::Logger::global().setMinLevel(_previousLevel);
    }

    CaptureSink& sink() { return *_sink; }

private:
    std::shared_ptr<CaptureSink> _sink;
    Logging::LogLevel _previousLevel;
};

/**
 * @brief Transport driven by a test lambda, counting every send
 */
class ScriptedTransport : public Bridge::IRemoteTransport {
public:
    using Script = std::function<std::string(const std::string& url, const std::string& body, const Bridge::Headers& headers)>;

    explicit ScriptedTransport(Script script) : _script(std::move(script)) {}

    std::string send(const std::string& url, const std::string& body, const Bridge::Headers& headers) override {
        _calls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _bodies.push_back(body);
        }
        return _script(url, body, headers);
    }

    size_t calls() const { return _calls.load(); }

    std::vector<std::string> bodies() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _bodies;
    }

private:
    Script _script;
    std::atomic<size_t> _calls{0};
    mutable std::mutex _mutex;
    std::vector<std::string> _bodies;
};

} // namespace Testing
} // namespace Core
} // namespace FlowEngine
