/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file EventBus.h
 * @brief Topic-keyed publish-subscribe bus, one per engine
 *
 * Workflow lifecycle notifications are identified by name ("step:before",
 * "workflow:finish", "step:suspended:charge") rather than by C++ type, so this
 * bus keys its handler lists by topic string and carries a single payload type.
 */

#pragma once

#include "../Logging/Logger.h"
#include <exception>
#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace FlowEngine {
namespace Core {

/**
 * @brief Publish-subscribe by topic name
 *
 * Handlers for a topic run synchronously on the publishing thread, in
 * subscription order. The handler list is copied before the calls so a handler
 * may subscribe or unsubscribe (itself included) without deadlocking.
 *
 * A handler that throws is logged and skipped; the remaining handlers still run
 * and the exception never reaches the publisher.
 *
 * @tparam Payload The event record every topic carries
 *
 * @code
 * EventBus<WorkflowEvent> bus;
 * auto id = bus.subscribe("step:after", [](const WorkflowEvent& e) {
 *     std::cout << e.stepName << " done\n";
 * });
 *
 * bus.publish("step:after", event);
 * bus.unsubscribe("step:after", id);
 * @endcode
 */
template<typename Payload>
class EventBus {
public:
    using HandlerId = size_t;
    using Handler = std::function<void(const Payload&)>;

    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Registers a handler for one topic
     * @return Id to hand back to unsubscribe()
     */
    HandlerId subscribe(const std::string& topic, Handler handler) {
        std::lock_guard<std::mutex> lock(_mutex);
        HandlerId id = _nextHandlerId++;
        _handlers[topic].emplace_back(id, std::move(handler));
        return id;
    }

    /// @return false if the id was not subscribed to this topic
    bool unsubscribe(const std::string& topic, HandlerId handlerId) {
        std::lock_guard<std::mutex> lock(_mutex);

        auto it = _handlers.find(topic);
        if (it == _handlers.end()) {
            return false;
        }

        auto& handlers = it->second;
        for (auto handlerIt = handlers.begin(); handlerIt != handlers.end(); ++handlerIt) {
            if (handlerIt->first == handlerId) {
                handlers.erase(handlerIt);
                if (handlers.empty()) {
                    _handlers.erase(it);
                }
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Delivers a payload to every handler of a topic
     *
     * Publishing to a topic nobody listens to is a no-op.
     */
    void publish(const std::string& topic, const Payload& payload) {
        std::vector<std::pair<HandlerId, Handler>> handlersToCall;

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _handlers.find(topic);
            if (it != _handlers.end()) {
                handlersToCall = it->second;
            }
        }

        for (const auto& [id, handler] : handlersToCall) {
            try {
                handler(payload);
            } catch (const std::exception& e) {
                FLOW_LOG_WARNING_CAT("EventBus",
                    std::format("Handler {} for '{}' threw: {}", id, topic, e.what()));
            } catch (...) {
                FLOW_LOG_WARNING_CAT("EventBus",
                    std::format("Handler {} for '{}' threw a non-standard exception", id, topic));
            }
        }
    }

    size_t getSubscriberCount(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _handlers.find(topic);
        return (it != _handlers.end()) ? it->second.size() : 0;
    }

    bool hasSubscribers() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return !_handlers.empty();
    }

    size_t getTotalSubscriptions() const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t total = 0;
        for (const auto& [topic, handlers] : _handlers) {
            total += handlers.size();
        }
        return total;
    }

    /// Drops every subscription; outstanding ids become invalid
    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _handlers.clear();
    }

private:
    mutable std::mutex _mutex;
    std::unordered_map<std::string, std::vector<std::pair<HandlerId, Handler>>> _handlers;
    HandlerId _nextHandlerId = 1;
};

} // namespace Core
} // namespace FlowEngine
