/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "WorkflowTypes.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Flow {

    /**
     * @brief Step definitions and static edges of one workflow instance
     *
     * Lookups hand out shared_ptr<const StepDefinition>, so redefining a step
     * while it executes is safe: the running execution keeps the definition it
     * started with and queued items pick up the new one when dequeued.
     */
    class StepRegistry {
    public:
        using DefinitionPtr = std::shared_ptr<const StepDefinition>;

        /**
         * @brief Adds or replaces a step
         * @return true if the name was new
         * @throws std::invalid_argument for an empty name, or Reduce merge without a reducer
         */
        bool define(const std::string& name, StepDefinition definition);

        DefinitionPtr find(const std::string& name) const;
        bool contains(const std::string& name) const;
        std::vector<std::string> stepNames() const;

        /// Appends to the adjacency list of from, skipping names already present
        void connect(const std::string& from, const std::vector<std::string>& to);

        std::vector<std::string> edges(const std::string& from) const;
        std::map<std::string, std::vector<std::string>> allEdges() const;
        void replaceEdges(std::map<std::string, std::vector<std::string>> edges);

        /// {"hasEffect": bool, "hasBranch": bool, "hasGuard": bool}
        static Value metaOf(const StepDefinition& definition);

    private:
        mutable std::mutex _mutex;
        std::map<std::string, DefinitionPtr> _steps;
        std::map<std::string, std::vector<std::string>> _edges;
    };

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
