/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file LogLevel.h
 * @brief Severity levels for the FlowCore logger
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace FlowEngine {
namespace Core {
namespace Logging {

    /**
     * @brief Log severity, least to most severe
     *
     * A minimum level admits itself and everything above it, so Warning lets
     * Warning, Error and Fatal through.
     */
    enum class LogLevel : uint8_t {
        Trace = 0,    ///< Per-item scheduler chatter (queue moves, cache hits)
        Debug = 1,    ///< Step lifecycle details, guard vetoes, resolved branches
        Info = 2,     ///< Engine and bridge startup/shutdown
        Warning = 3,  ///< Bridge fallbacks, retries, subscriber exceptions
        Error = 4,    ///< Terminal step failures, bridge protocol errors
        Fatal = 5,    ///< Unrecoverable engine state
        Off = 6       ///< Disable all output
    };

    /**
     * @brief Fixed-width (5 character) level name for aligned console output
     *
     * @code
     * std::cout << "[" << logLevelToString(LogLevel::Warning) << "] retry 2\n";
     * // [WARN ] retry 2
     * @endcode
     */
    inline constexpr std::string_view logLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "TRACE";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Fatal:   return "FATAL";
            case LogLevel::Off:     return "OFF  ";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Parse a level name, case-insensitively
     *
     * Accepts "warn" for Warning. Anything unrecognized maps to Info, which is
     * what the engine config loader relies on for a missing or bad "logLevel".
     *
     * @param str Level name such as "debug", "WARN" or "Error"
     * @return Matching level, or Info
     */
    inline LogLevel stringToLogLevel(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (str == "trace") return LogLevel::Trace;
        if (str == "debug") return LogLevel::Debug;
        if (str == "info") return LogLevel::Info;
        if (str == "warning" || str == "warn") return LogLevel::Warning;
        if (str == "error") return LogLevel::Error;
        if (str == "fatal") return LogLevel::Fatal;
        if (str == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

} // namespace Logging
} // namespace Core
} // namespace FlowEngine
