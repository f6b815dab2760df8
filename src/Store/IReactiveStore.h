/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file IReactiveStore.h
 * @brief The path-addressed value tree the workflow engine reads, writes and watches
 */

#pragma once

#include "../Core/Value.h"
#include <cstdint>
#include <functional>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Store {

    using NodeId = uint64_t;
    using WatchId = uint64_t;

    inline constexpr NodeId InvalidNode = 0;
    inline constexpr WatchId InvalidWatch = 0;

    /// Invoked with (newValue, oldValue) after a set() that changed the node
    using WatchCallback = std::function<void(const Value&, const Value&)>;

    /**
     * @brief Reactive value store contract
     *
     * Nodes are addressed by dot-separated paths ("flows.order.nodes.charge")
     * and identified by NodeId once resolved. Every node holds one Value.
     *
     * The set() contract is what keeps reactive graphs from looping: writing a
     * value equal to the current one (Value::operator==) changes nothing and
     * notifies nobody. A step that re-publishes an unchanged output therefore
     * does not wake its own watcher.
     *
     * Watchers run synchronously on the writing thread, after the store has
     * released whatever lock it holds, so a watcher may read or write the store.
     *
     * @code
     * MemoryStore store;
     * NodeId temp = store.resolve("sensors.temp");
     * store.watch(temp, [](const Value& now, const Value& before) {
     *     std::cout << "temp " << now.asDouble() << "\n";
     * });
     * store.set(temp, 21.5);   // watcher runs
     * store.set(temp, 21.5);   // returns false, watcher does not run
     * @endcode
     */
    class IReactiveStore {
    public:
        virtual ~IReactiveStore() = default;

        /**
         * @brief Looks up a node by path
         * @param create When true, missing nodes along the path are created
         * @return The node, or InvalidNode if it is missing and create is false
         */
        virtual NodeId resolve(const std::string& path, bool create = true) = 0;

        /// Resolves a direct child by name, with the same create rule as resolve()
        virtual NodeId child(NodeId parent, const std::string& name, bool create = true) = 0;

        /// @throws std::out_of_range for an unknown node
        virtual Value get(NodeId node) const = 0;

        /**
         * @brief Writes a node and notifies its watchers if the value changed
         * @return true if the value changed, false if it was equal to the current one
         * @throws std::out_of_range for an unknown node
         */
        virtual bool set(NodeId node, Value value) = 0;

        virtual WatchId watch(NodeId node, WatchCallback onChange) = 0;

        /// @return false if the id is not registered
        virtual bool unwatch(WatchId id) = 0;

        /// Full dot path of a node, empty for the root
        virtual std::string pathOf(NodeId node) const = 0;
    };

} // namespace Store
} // namespace Core
} // namespace FlowEngine
