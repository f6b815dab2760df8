/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "StepLog.h"
#include <chrono>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Flow {

namespace {
    int64_t nowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

const char* toString(StepLogLevel level) {
    switch (level) {
        case StepLogLevel::Info:  return "info";
        case StepLogLevel::Warn:  return "warn";
        case StepLogLevel::Error: return "error";
    }
    return "info";
}

std::optional<StepLogLevel> parseStepLogLevel(std::string_view text) {
    if (text == "info") return StepLogLevel::Info;
    if (text == "warn") return StepLogLevel::Warn;
    if (text == "error") return StepLogLevel::Error;
    return std::nullopt;
}

Value StepLogEntry::toValue() const {
    Value v = Value::Object{};
    v["ts"] = ts;
    v["level"] = toString(level);
    v["args"] = args;
    return v;
}

StepLogEntry StepLogEntry::fromValue(const Value& value) {
    const Value* ts = value.find("ts");
    const Value* level = value.find("level");
    const Value* args = value.find("args");
    if (!ts || !ts->isNumber() || !level || !level->isString()) {
        throw std::invalid_argument("Step log entry needs numeric 'ts' and string 'level'");
    }

    auto parsedLevel = parseStepLogLevel(level->asString());
    if (!parsedLevel) {
        throw std::invalid_argument("Unknown step log level '" + level->asString() + "'");
    }

    StepLogEntry entry;
    entry.ts = ts->isInt() ? ts->asInt() : static_cast<int64_t>(ts->asDouble());
    entry.level = *parsedLevel;
    if (args && args->isArray()) {
        entry.args = args->asArray();
    }
    return entry;
}

StepLog::StepLog(size_t ringSize)
    : _ringSize(ringSize == 0 ? 1 : ringSize) {
}

void StepLog::pushLocked(Stream& stream, StepLogEntry entry) {
    stream.archive.push_back(entry);
    stream.ring.push_back(std::move(entry));
    while (stream.ring.size() > _ringSize) {
        stream.ring.pop_front();
    }
}

StepLogEntry StepLog::append(const std::string& stepName, StepLogLevel level, Value::Array args) {
    StepLogEntry entry{nowMs(), level, std::move(args)};
    std::lock_guard<std::mutex> lock(_mutex);
    pushLocked(_streams[stepName], entry);
    return entry;
}

void StepLog::appendEntry(const std::string& stepName, StepLogEntry entry) {
    std::lock_guard<std::mutex> lock(_mutex);
    pushLocked(_streams[stepName], std::move(entry));
}

std::vector<StepLogEntry> StepLog::ring(const std::string& stepName) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _streams.find(stepName);
    if (it == _streams.end()) return {};
    return {it->second.ring.begin(), it->second.ring.end()};
}

std::vector<StepLogEntry> StepLog::archive(const std::string& stepName) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _streams.find(stepName);
    if (it == _streams.end()) return {};
    return it->second.archive;
}

std::vector<std::string> StepLog::stepNames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> names;
    names.reserve(_streams.size());
    for (const auto& [name, stream] : _streams) {
        names.push_back(name);
    }
    return names;
}

Value StepLog::toValue() const {
    std::lock_guard<std::mutex> lock(_mutex);
    Value out = Value::Object{};
    for (const auto& [name, stream] : _streams) {
        Value::Array ring;
        for (const auto& entry : stream.ring) ring.push_back(entry.toValue());
        Value::Array archive;
        for (const auto& entry : stream.archive) archive.push_back(entry.toValue());

        Value streamValue = Value::Object{};
        streamValue["ring"] = std::move(ring);
        streamValue["archive"] = std::move(archive);
        out[name] = std::move(streamValue);
    }
    return out;
}

void StepLog::restore(const Value& value) {
    if (!value.isObject()) {
        throw std::invalid_argument("Step logs must be an object keyed by step name");
    }

    std::map<std::string, Stream> streams;
    for (const auto& [name, streamValue] : value.asObject()) {
        Stream stream;
        if (const Value* archive = streamValue.find("archive"); archive && archive->isArray()) {
            for (const auto& entry : archive->asArray()) {
                stream.archive.push_back(StepLogEntry::fromValue(entry));
            }
        }
        if (const Value* ring = streamValue.find("ring"); ring && ring->isArray()) {
            for (const auto& entry : ring->asArray()) {
                stream.ring.push_back(StepLogEntry::fromValue(entry));
            }
        }
        while (stream.ring.size() > _ringSize) {
            stream.ring.pop_front();
        }
        streams.emplace(name, std::move(stream));
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _streams = std::move(streams);
}

void StepLog::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _streams.clear();
}

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
