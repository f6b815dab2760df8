/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "PendingCall.h"
#include "../Logging/Logger.h"
#include <format>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    bool PendingCall::isReady() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _ready;
    }

    void PendingCall::onReady(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_ready) {
                _callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

    bool PendingCall::waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _readyCV.wait_for(lock, timeout, [this]() { return _ready; });
    }

    void PendingCall::resolve() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_ready) {
                return;
            }
            _ready = true;
            callbacks.swap(_callbacks);
        }
        _readyCV.notify_all();

        for (auto& callback : callbacks) {
            try {
                callback();
            } catch (const std::exception& e) {
                FLOW_LOG_WARNING_CAT("Bridge", std::format("Completion callback for '{}' threw: {}", _key, e.what()));
            } catch (...) {
                FLOW_LOG_WARNING_CAT("Bridge", std::format("Completion callback for '{}' threw a non-standard exception", _key));
            }
        }
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
