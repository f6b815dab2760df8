/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "../Core/Value.h"
#include "../CoreCommon.h"
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    enum class StepLogLevel : uint8_t {
        Info = 0,
        Warn = 1,
        Error = 2
    };

    const char* toString(StepLogLevel level);
    std::optional<StepLogLevel> parseStepLogLevel(std::string_view text);

    struct StepLogEntry {
        int64_t ts = 0;             ///< Milliseconds since the Unix epoch
        StepLogLevel level = StepLogLevel::Info;
        Value::Array args;

        /// {"ts": ..., "level": "info", "args": [...]}
        Value toValue() const;

        /// @throws std::invalid_argument if the value is not an entry object
        static StepLogEntry fromValue(const Value& value);
    };

    /**
     * @brief Per-step debug history: a bounded ring plus an unbounded archive
     *
     * Every append goes to both. The ring drops its oldest entry once it holds
     * ringSize entries; the archive keeps everything. Bridge fallbacks, retries
     * and guard vetoes are recorded here rather than on the event bus.
     *
     * @code
     * StepLog log(3);
     * log.append("fetch", StepLogLevel::Warn, {"retry", 2});
     * auto recent = log.ring("fetch");     // at most 3 entries
     * auto all = log.archive("fetch");     // everything
     * @endcode
     */
    class StepLog {
    public:
        explicit StepLog(size_t ringSize = DefaultStepLogSize);

        /// @return The stored entry, timestamped now
        StepLogEntry append(const std::string& stepName, StepLogLevel level, Value::Array args);

        /// Appends an entry as-is, keeping its timestamp (remote logs, restored snapshots)
        void appendEntry(const std::string& stepName, StepLogEntry entry);

        std::vector<StepLogEntry> ring(const std::string& stepName) const;
        std::vector<StepLogEntry> archive(const std::string& stepName) const;
        std::vector<std::string> stepNames() const;

        size_t ringSize() const { return _ringSize; }

        /// {"<step>": {"ring": [...], "archive": [...]}, ...}
        Value toValue() const;

        /// Replaces all streams; @throws std::invalid_argument on a malformed value
        void restore(const Value& value);

        void clear();

    private:
        struct Stream {
            std::deque<StepLogEntry> ring;
            std::vector<StepLogEntry> archive;
        };

        void pushLocked(Stream& stream, StepLogEntry entry);

        mutable std::mutex _mutex;
        size_t _ringSize;
        std::map<std::string, Stream> _streams;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
