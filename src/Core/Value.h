/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file Value.h
 * @brief Tagged dynamic value carried through payloads, shared state and the store
 *
 * Step payloads, step outputs, the per-instance shared map and every node of
 * the reactive store hold a Value. It is a closed variant so that it can cross
 * the bridge and be written into snapshots without guessing at types.
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace FlowEngine {
namespace Core {

    /**
     * @brief Null, bool, integer, double, string, bytes, array or object
     *
     * Objects are key-ordered maps, so two objects with the same entries always
     * serialize identically (the bridge cache relies on that for its keys).
     *
     * Equality is structural and type-strict: Value(1) != Value(1.0). This is
     * the equality rule the store uses to decide whether a set() is a change,
     * and so it is what suppresses a step re-triggering itself on an unchanged
     * output.
     *
     * @code
     * Value order = Value::Object{};
     * order["sku"] = "A-113";
     * order["qty"] = 3;
     * order["tags"] = Value::Array{"fragile", "gift"};
     *
     * int64_t qty = order.at("qty").asInt();
     * bool same = (order == order);  // true
     * @endcode
     */
    class Value {
    public:
        using Null = std::monostate;
        using Bytes = std::vector<uint8_t>;
        using Array = std::vector<Value>;
        using Object = std::map<std::string, Value>;

        enum class Type : uint8_t {
            Null = 0,
            Bool,
            Int,
            Double,
            String,
            Bytes,
            Array,
            Object
        };

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool b) : _data(b) {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T v) : _data(static_cast<int64_t>(v)) {}

        template<std::floating_point T>
        Value(T v) : _data(static_cast<double>(v)) {}

        Value(const char* s) : _data(std::string(s)) {}
        Value(std::string s) : _data(std::move(s)) {}
        Value(std::string_view s) : _data(std::string(s)) {}
        Value(Bytes b) : _data(std::move(b)) {}
        Value(Array a) : _data(std::move(a)) {}
        Value(Object o) : _data(std::move(o)) {}

        Type type() const { return static_cast<Type>(_data.index()); }
        const char* typeName() const;

        bool isNull() const { return type() == Type::Null; }
        bool isBool() const { return type() == Type::Bool; }
        bool isInt() const { return type() == Type::Int; }
        bool isDouble() const { return type() == Type::Double; }
        bool isNumber() const { return isInt() || isDouble(); }
        bool isString() const { return type() == Type::String; }
        bool isBytes() const { return type() == Type::Bytes; }
        bool isArray() const { return type() == Type::Array; }
        bool isObject() const { return type() == Type::Object; }

        /// @throws std::runtime_error when the held type differs
        bool asBool() const;
        int64_t asInt() const;
        /// Integers widen to double; anything else throws
        double asDouble() const;
        const std::string& asString() const;
        const Bytes& asBytes() const;
        const Array& asArray() const;
        Array& asArray();
        const Object& asObject() const;
        Object& asObject();

        /// Falsy: null, false, 0, 0.0, empty string/bytes/array/object
        bool truthy() const;

        /**
         * @brief Object member access, creating the member if missing
         *
         * A null Value turns into an empty object first, mirroring how the
         * store creates intermediate nodes on demand.
         *
         * @throws std::runtime_error if the Value holds something other than null or an object
         */
        Value& operator[](const std::string& key);

        /// @throws std::out_of_range if missing, std::runtime_error if not an object
        const Value& at(const std::string& key) const;

        /// Pointer to a member, or nullptr when missing or not an object
        const Value* find(const std::string& key) const;
        bool contains(const std::string& key) const { return find(key) != nullptr; }

        /// Appends to an array, turning null into an empty array first
        void push_back(Value v);

        /// Element count of arrays/objects/strings/bytes, 0 otherwise
        size_t size() const;

        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        std::variant<Null, bool, int64_t, double, std::string, Bytes, Array, Object> _data;
    };

} // namespace Core
} // namespace FlowEngine
