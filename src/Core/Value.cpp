/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "Value.h"
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {

namespace {
    [[noreturn]] void throwTypeMismatch(const char* wanted, const Value& v) {
        throw std::runtime_error(std::format("Value holds {}, not {}", v.typeName(), wanted));
    }
}

const char* Value::typeName() const {
    switch (type()) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Int:    return "int";
        case Type::Double: return "double";
        case Type::String: return "string";
        case Type::Bytes:  return "bytes";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

bool Value::asBool() const {
    if (auto* b = std::get_if<bool>(&_data)) return *b;
    throwTypeMismatch("bool", *this);
}

int64_t Value::asInt() const {
    if (auto* i = std::get_if<int64_t>(&_data)) return *i;
    throwTypeMismatch("int", *this);
}

double Value::asDouble() const {
    if (auto* d = std::get_if<double>(&_data)) return *d;
    if (auto* i = std::get_if<int64_t>(&_data)) return static_cast<double>(*i);
    throwTypeMismatch("double", *this);
}

const std::string& Value::asString() const {
    if (auto* s = std::get_if<std::string>(&_data)) return *s;
    throwTypeMismatch("string", *this);
}

const Value::Bytes& Value::asBytes() const {
    if (auto* b = std::get_if<Bytes>(&_data)) return *b;
    throwTypeMismatch("bytes", *this);
}

const Value::Array& Value::asArray() const {
    if (auto* a = std::get_if<Array>(&_data)) return *a;
    throwTypeMismatch("array", *this);
}

Value::Array& Value::asArray() {
    if (auto* a = std::get_if<Array>(&_data)) return *a;
    throwTypeMismatch("array", *this);
}

const Value::Object& Value::asObject() const {
    if (auto* o = std::get_if<Object>(&_data)) return *o;
    throwTypeMismatch("object", *this);
}

Value::Object& Value::asObject() {
    if (auto* o = std::get_if<Object>(&_data)) return *o;
    throwTypeMismatch("object", *this);
}

bool Value::truthy() const {
    switch (type()) {
        case Type::Null:   return false;
        case Type::Bool:   return std::get<bool>(_data);
        case Type::Int:    return std::get<int64_t>(_data) != 0;
        case Type::Double: return std::get<double>(_data) != 0.0;
        default:           return size() > 0;
    }
}

Value& Value::operator[](const std::string& key) {
    if (isNull()) {
        _data = Object{};
    }
    return asObject()[key];
}

const Value& Value::at(const std::string& key) const {
    const auto& obj = asObject();
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::out_of_range(std::format("Value has no member '{}'", key));
    }
    return it->second;
}

const Value* Value::find(const std::string& key) const {
    auto* obj = std::get_if<Object>(&_data);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    return it == obj->end() ? nullptr : &it->second;
}

void Value::push_back(Value v) {
    if (isNull()) {
        _data = Array{};
    }
    asArray().push_back(std::move(v));
}

size_t Value::size() const {
    switch (type()) {
        case Type::String: return std::get<std::string>(_data).size();
        case Type::Bytes:  return std::get<Bytes>(_data).size();
        case Type::Array:  return std::get<Array>(_data).size();
        case Type::Object: return std::get<Object>(_data).size();
        default:           return 0;
    }
}

bool Value::operator==(const Value& other) const {
    return _data == other._data;
}

} // namespace Core
} // namespace FlowEngine
