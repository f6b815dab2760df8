/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "IReactiveStore.h"
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Store {

    /**
     * @brief Thread-safe in-memory IReactiveStore
     *
     * One mutex guards the node table and the watcher table. set() swaps the
     * value under the lock, copies the node's watcher callbacks, then calls them
     * after unlocking. A watcher that throws is logged and the remaining
     * watchers still run.
     */
    class MemoryStore : public IReactiveStore {
    public:
        MemoryStore();
        ~MemoryStore() override = default;

        MemoryStore(const MemoryStore&) = delete;
        MemoryStore& operator=(const MemoryStore&) = delete;

        NodeId resolve(const std::string& path, bool create = true) override;
        NodeId child(NodeId parent, const std::string& name, bool create = true) override;
        Value get(NodeId node) const override;
        bool set(NodeId node, Value value) override;
        WatchId watch(NodeId node, WatchCallback onChange) override;
        bool unwatch(WatchId id) override;
        std::string pathOf(NodeId node) const override;

        NodeId root() const { return _rootId; }
        size_t nodeCount() const;
        size_t watcherCount(NodeId node) const;

    private:
        struct Node {
            NodeId parent = InvalidNode;
            std::string path;
            Value value;
            std::unordered_map<std::string, NodeId> children;
            std::vector<WatchId> watchers;
        };

        struct Watcher {
            NodeId node;
            WatchCallback callback;
        };

        NodeId childLocked(NodeId parent, std::string_view name, bool create);
        const Node& nodeLocked(NodeId node) const;
        Node& nodeLocked(NodeId node);

        mutable std::mutex _mutex;
        std::unordered_map<NodeId, Node> _nodes;
        std::unordered_map<WatchId, Watcher> _watchers;
        NodeId _rootId = 1;
        NodeId _nextNodeId = 2;
        WatchId _nextWatchId = 1;
    };

} // namespace Store
} // namespace Core
} // namespace FlowEngine
