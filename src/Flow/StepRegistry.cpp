/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "StepRegistry.h"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Flow {

bool StepRegistry::define(const std::string& name, StepDefinition definition) {
    if (name.empty()) {
        throw std::invalid_argument("Step name must not be empty");
    }
    if (name.find('.') != std::string::npos) {
        throw std::invalid_argument(std::format("Step name '{}' must not contain '.'", name));
    }
    if (definition.merge == MergeStrategy::Reduce && !definition.reducer) {
        throw std::invalid_argument(std::format("Step '{}' uses Reduce merge without a reducer", name));
    }
    if (definition.retry && definition.retry->maxAttempts == 0) {
        throw std::invalid_argument(std::format("Step '{}' retry needs maxAttempts >= 1", name));
    }

    auto ptr = std::make_shared<const StepDefinition>(std::move(definition));
    std::lock_guard<std::mutex> lock(_mutex);
    auto [it, inserted] = _steps.insert_or_assign(name, std::move(ptr));
    return inserted;
}

StepRegistry::DefinitionPtr StepRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _steps.find(name);
    return it == _steps.end() ? nullptr : it->second;
}

bool StepRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _steps.contains(name);
}

std::vector<std::string> StepRegistry::stepNames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> names;
    names.reserve(_steps.size());
    for (const auto& [name, def] : _steps) {
        names.push_back(name);
    }
    return names;
}

void StepRegistry::connect(const std::string& from, const std::vector<std::string>& to) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto& list = _edges[from];
    for (const auto& name : to) {
        if (std::find(list.begin(), list.end(), name) == list.end()) {
            list.push_back(name);
        }
    }
}

std::vector<std::string> StepRegistry::edges(const std::string& from) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _edges.find(from);
    return it == _edges.end() ? std::vector<std::string>{} : it->second;
}

std::map<std::string, std::vector<std::string>> StepRegistry::allEdges() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _edges;
}

void StepRegistry::replaceEdges(std::map<std::string, std::vector<std::string>> edges) {
    std::lock_guard<std::mutex> lock(_mutex);
    _edges = std::move(edges);
}

Value StepRegistry::metaOf(const StepDefinition& definition) {
    Value meta = Value::Object{};
    meta["hasEffect"] = definition.hasEffect();
    meta["hasBranch"] = definition.hasBranch();
    meta["hasGuard"] = definition.hasGuard();
    return meta;
}

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
