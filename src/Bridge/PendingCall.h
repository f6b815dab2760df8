/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /**
     * @brief Handle to a bridge call still in flight
     *
     * Returned instead of a response when the caller may not block. It only
     * says when the call finished; the outcome is collected by repeating the
     * same call, which then answers from the bridge without touching the
     * transport again.
     *
     * @code
     * auto outcome = bridge.call(request);
     * if (auto* pending = std::get_if<std::shared_ptr<PendingCall>>(&outcome)) {
     *     (*pending)->onReady([&]() { replayStep(); });
     * }
     * @endcode
     */
    class PendingCall {
    public:
        explicit PendingCall(std::string key) : _key(std::move(key)) {}

        PendingCall(const PendingCall&) = delete;
        PendingCall& operator=(const PendingCall&) = delete;

        /// Bridge cache key of the call this handle tracks
        const std::string& key() const { return _key; }

        bool isReady() const;

        /**
         * @brief Registers a callback for completion
         *
         * Runs immediately on the calling thread if already complete, otherwise
         * later on the thread that completes the call.
         */
        void onReady(std::function<void()> callback);

        /// @return true if the call completed within the timeout
        bool waitFor(std::chrono::milliseconds timeout) const;

        /// Marks complete and runs the callbacks; later calls do nothing
        void resolve();

    private:
        std::string _key;
        mutable std::mutex _mutex;
        mutable std::condition_variable _readyCV;
        bool _ready = false;
        std::vector<std::function<void()>> _callbacks;
    };

    using PendingCallPtr = std::shared_ptr<PendingCall>;

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
