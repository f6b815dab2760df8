/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "MemoryStore.h"
#include "../Debug/Profiling.h"
#include "../Logging/Logger.h"
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Store {

MemoryStore::MemoryStore() {
    _nodes.emplace(_rootId, Node{});
}

const MemoryStore::Node& MemoryStore::nodeLocked(NodeId node) const {
    auto it = _nodes.find(node);
    if (it == _nodes.end()) {
        throw std::out_of_range(std::format("Unknown store node {}", node));
    }
    return it->second;
}

MemoryStore::Node& MemoryStore::nodeLocked(NodeId node) {
    auto it = _nodes.find(node);
    if (it == _nodes.end()) {
        throw std::out_of_range(std::format("Unknown store node {}", node));
    }
    return it->second;
}

NodeId MemoryStore::childLocked(NodeId parent, std::string_view name, bool create) {
    Node& parentNode = nodeLocked(parent);
    auto it = parentNode.children.find(std::string(name));
    if (it != parentNode.children.end()) {
        return it->second;
    }
    if (!create) {
        return InvalidNode;
    }

    NodeId id = _nextNodeId++;
    Node node;
    node.parent = parent;
    node.path = parentNode.path.empty()
        ? std::string(name)
        : std::format("{}.{}", parentNode.path, name);

    parentNode.children.emplace(std::string(name), id);
    _nodes.emplace(id, std::move(node));
    return id;
}

NodeId MemoryStore::resolve(const std::string& path, bool create) {
    std::lock_guard<std::mutex> lock(_mutex);

    NodeId current = _rootId;
    std::string_view rest(path);
    while (!rest.empty()) {
        size_t dot = rest.find('.');
        std::string_view segment = rest.substr(0, dot);
        if (segment.empty()) {
            throw std::invalid_argument(std::format("Empty segment in store path '{}'", path));
        }

        current = childLocked(current, segment, create);
        if (current == InvalidNode) {
            return InvalidNode;
        }
        rest = (dot == std::string_view::npos) ? std::string_view{} : rest.substr(dot + 1);
    }
    return current;
}

NodeId MemoryStore::child(NodeId parent, const std::string& name, bool create) {
    if (name.empty() || name.find('.') != std::string::npos) {
        throw std::invalid_argument(std::format("Invalid child name '{}'", name));
    }
    std::lock_guard<std::mutex> lock(_mutex);
    return childLocked(parent, name, create);
}

Value MemoryStore::get(NodeId node) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return nodeLocked(node).value;
}

bool MemoryStore::set(NodeId node, Value value) {
    FLOW_PROFILE_ZONE();
    Value previous;
    Value current;
    std::vector<std::pair<WatchId, WatchCallback>> toNotify;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        Node& target = nodeLocked(node);
        if (target.value == value) {
            return false;
        }

        previous = std::move(target.value);
        target.value = std::move(value);
        current = target.value;

        toNotify.reserve(target.watchers.size());
        for (WatchId id : target.watchers) {
            auto it = _watchers.find(id);
            if (it != _watchers.end()) {
                toNotify.emplace_back(id, it->second.callback);
            }
        }
    }

    for (const auto& [id, callback] : toNotify) {
        try {
            callback(current, previous);
        } catch (const std::exception& e) {
            FLOW_LOG_WARNING_CAT("Store", std::format("Watcher {} threw: {}", id, e.what()));
        } catch (...) {
            FLOW_LOG_WARNING_CAT("Store", std::format("Watcher {} threw a non-standard exception", id));
        }
    }
    return true;
}

WatchId MemoryStore::watch(NodeId node, WatchCallback onChange) {
    std::lock_guard<std::mutex> lock(_mutex);
    Node& target = nodeLocked(node);
    WatchId id = _nextWatchId++;
    target.watchers.push_back(id);
    _watchers.emplace(id, Watcher{node, std::move(onChange)});
    return id;
}

bool MemoryStore::unwatch(WatchId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _watchers.find(id);
    if (it == _watchers.end()) {
        return false;
    }

    auto nodeIt = _nodes.find(it->second.node);
    if (nodeIt != _nodes.end()) {
        auto& list = nodeIt->second.watchers;
        std::erase(list, id);
    }
    _watchers.erase(it);
    return true;
}

std::string MemoryStore::pathOf(NodeId node) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return nodeLocked(node).path;
}

size_t MemoryStore::nodeCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _nodes.size();
}

size_t MemoryStore::watcherCount(NodeId node) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return nodeLocked(node).watchers.size();
}

} // namespace Store
} // namespace Core
} // namespace FlowEngine
