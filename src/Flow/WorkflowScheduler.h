/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file WorkflowScheduler.h
 * @brief Queue, inbox and reentrancy flag behind Workflow::pump()
 *
 * The scheduler holds the state; the pump loop itself lives in Workflow so it
 * can emit events and run the executor. Items enqueued while a step executes
 * land in the queue and are taken by a later iteration of the same pump.
 * Continuations that arrive from other threads (retry timers, resumed bridge
 * calls) go to the inbox and are moved into the queue by the pump.
 */

#pragma once

#include "WorkflowTypes.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    class WorkflowScheduler {
    public:
        WorkflowScheduler(QueueOrder order, Budgets budgets)
            : _order(order), _budgets(budgets) {}

        void push(QueueItem item);

        /// Next item per the configured order, or nullopt when the queue is empty
        std::optional<QueueItem> take();

        void postToInbox(QueueItem item);

        /// Moves inbox items to the back of the queue; @return how many moved
        size_t drainInbox();

        bool hasInbox() const;
        size_t queueSize() const;
        bool queueEmpty() const { return queueSize() == 0; }

        std::vector<QueueItem> queueSnapshot() const;
        void replaceQueue(std::vector<QueueItem> items);

        /// Takes the running flag; false if a pump is already in progress
        bool tryAcquire();
        void release();
        bool isRunning() const { return _running.load(std::memory_order_acquire); }

        /**
         * @brief Whether a pump that started at pumpStart and ran executed items must stop
         */
        bool budgetExhausted(uint64_t executed, std::chrono::steady_clock::time_point pumpStart) const;

        QueueOrder order() const { return _order; }
        const Budgets& budgets() const { return _budgets; }

    private:
        QueueOrder _order;
        Budgets _budgets;

        mutable std::mutex _queueMutex;
        std::deque<QueueItem> _queue;

        mutable std::mutex _inboxMutex;
        std::vector<QueueItem> _inbox;

        std::atomic<bool> _running{false};
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
