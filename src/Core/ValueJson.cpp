/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "ValueJson.h"
#include <array>
#include <format>
#include <limits>
#include <stdexcept>

namespace FlowEngine {
namespace Core {

namespace {
    constexpr std::string_view Base64Alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    constexpr std::array<int8_t, 256> makeDecodeTable() {
        std::array<int8_t, 256> table{};
        for (auto& entry : table) entry = -1;
        for (size_t i = 0; i < Base64Alphabet.size(); ++i) {
            table[static_cast<uint8_t>(Base64Alphabet[i])] = static_cast<int8_t>(i);
        }
        return table;
    }

    constexpr auto DecodeTable = makeDecodeTable();
}

std::string base64Encode(const Value::Bytes& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t triple = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
        out.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(Base64Alphabet[(triple >> 6) & 0x3F]);
        out.push_back(Base64Alphabet[triple & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t triple = uint32_t(bytes[i]) << 16;
        out.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t triple = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(Base64Alphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

Value::Bytes base64Decode(std::string_view text) {
    Value::Bytes out;
    out.reserve((text.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=') break;
        int8_t v = DecodeTable[static_cast<uint8_t>(c)];
        if (v < 0) {
            throw std::invalid_argument(std::format("Invalid base64 character '{}'", c));
        }
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }
    return out;
}

nlohmann::json toJson(const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            return nullptr;
        case Value::Type::Bool:
            return value.asBool();
        case Value::Type::Int:
            return value.asInt();
        case Value::Type::Double:
            return value.asDouble();
        case Value::Type::String:
            return value.asString();
        case Value::Type::Bytes:
            return nlohmann::json{{BytesTag, base64Encode(value.asBytes())}};
        case Value::Type::Array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : value.asArray()) {
                arr.push_back(toJson(item));
            }
            return arr;
        }
        case Value::Type::Object: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, item] : value.asObject()) {
                obj[key] = toJson(item);
            }
            return obj;
        }
    }
    return nullptr;
}

Value fromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(json.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            auto u = json.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value(static_cast<int64_t>(u));
            }
            return Value(static_cast<double>(u));
        }
        case nlohmann::json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::json::value_t::binary: {
            const auto& bin = json.get_binary();
            return Value(Value::Bytes(bin.begin(), bin.end()));
        }
        case nlohmann::json::value_t::array: {
            Value::Array arr;
            arr.reserve(json.size());
            for (const auto& item : json) {
                arr.push_back(fromJson(item));
            }
            return Value(std::move(arr));
        }
        case nlohmann::json::value_t::object: {
            if (json.size() == 1 && json.contains(BytesTag) && json[BytesTag].is_string()) {
                return Value(base64Decode(json[BytesTag].get<std::string>()));
            }
            Value::Object obj;
            for (auto it = json.begin(); it != json.end(); ++it) {
                obj.emplace(it.key(), fromJson(it.value()));
            }
            return Value(std::move(obj));
        }
    }
    return Value();
}

std::string toJsonString(const Value& value) {
    return toJson(value).dump();
}

Value parseJsonString(std::string_view text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::format("Malformed JSON: {}", e.what()));
    }
    return fromJson(parsed);
}

} // namespace Core
} // namespace FlowEngine
