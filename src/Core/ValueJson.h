/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file ValueJson.h
 * @brief Mapping between Value and nlohmann::json
 *
 * Used by the bridge wire format, the cache key builder and the snapshot codec.
 * JSON has no byte-string type, so bytes travel as a one-member object
 * {"$bytes": "<base64>"} and are recognized on the way back in.
 */

#pragma once

#include "Value.h"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace FlowEngine {
namespace Core {

    /// Member name marking a base64-encoded byte string
    inline constexpr const char* BytesTag = "$bytes";

    nlohmann::json toJson(const Value& value);

    /**
     * @brief Converts parsed JSON into a Value
     *
     * Integers that fit int64 stay integers, everything else numeric becomes a
     * double. Objects of the form {"$bytes": "..."} decode into Bytes.
     *
     * @throws std::invalid_argument if a $bytes member is not valid base64
     */
    Value fromJson(const nlohmann::json& json);

    /// Compact JSON text, keys in sorted order
    std::string toJsonString(const Value& value);

    /// @throws std::invalid_argument on malformed JSON text
    Value parseJsonString(std::string_view text);

    std::string base64Encode(const Value::Bytes& bytes);

    /// @throws std::invalid_argument on characters outside the base64 alphabet
    Value::Bytes base64Decode(std::string_view text);

} // namespace Core
} // namespace FlowEngine
