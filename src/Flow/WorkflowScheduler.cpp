/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "WorkflowScheduler.h"

namespace FlowEngine {
namespace Core {
namespace Flow {

    void WorkflowScheduler::push(QueueItem item) {
        std::lock_guard<std::mutex> lock(_queueMutex);
        _queue.push_back(std::move(item));
    }

    std::optional<QueueItem> WorkflowScheduler::take() {
        std::lock_guard<std::mutex> lock(_queueMutex);
        if (_queue.empty()) {
            return std::nullopt;
        }

        QueueItem item;
        if (_order == QueueOrder::Fifo) {
            item = std::move(_queue.front());
            _queue.pop_front();
        } else {
            item = std::move(_queue.back());
            _queue.pop_back();
        }
        return item;
    }

    void WorkflowScheduler::postToInbox(QueueItem item) {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        _inbox.push_back(std::move(item));
    }

    size_t WorkflowScheduler::drainInbox() {
        std::vector<QueueItem> arrived;
        {
            std::lock_guard<std::mutex> lock(_inboxMutex);
            arrived.swap(_inbox);
        }
        if (arrived.empty()) {
            return 0;
        }

        std::lock_guard<std::mutex> lock(_queueMutex);
        for (auto& item : arrived) {
            _queue.push_back(std::move(item));
        }
        return arrived.size();
    }

    bool WorkflowScheduler::hasInbox() const {
        std::lock_guard<std::mutex> lock(_inboxMutex);
        return !_inbox.empty();
    }

    size_t WorkflowScheduler::queueSize() const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return _queue.size();
    }

    std::vector<QueueItem> WorkflowScheduler::queueSnapshot() const {
        std::lock_guard<std::mutex> lock(_queueMutex);
        return {_queue.begin(), _queue.end()};
    }

    void WorkflowScheduler::replaceQueue(std::vector<QueueItem> items) {
        std::lock_guard<std::mutex> lock(_queueMutex);
        _queue.assign(std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    }

    bool WorkflowScheduler::tryAcquire() {
        bool expected = false;
        return _running.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    void WorkflowScheduler::release() {
        FLOW_ASSERT(_running.load(std::memory_order_acquire), "release() without a matching tryAcquire()");
        _running.store(false, std::memory_order_release);
    }

    bool WorkflowScheduler::budgetExhausted(uint64_t executed, std::chrono::steady_clock::time_point pumpStart) const {
        if (_budgets.maxSteps != 0 && executed >= _budgets.maxSteps) {
            return true;
        }
        if (_budgets.maxMillis != 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - pumpStart);
            return static_cast<uint64_t>(elapsed.count()) >= _budgets.maxMillis;
        }
        return false;
    }

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
