/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "WorkflowTypes.h"
#include <algorithm>
#include <cctype>

namespace FlowEngine {
namespace Core {
namespace Flow {

namespace {
    std::string lowered(std::string_view text) {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

const char* toString(ExecutionDomain domain) {
    switch (domain) {
        case ExecutionDomain::Local:  return "local";
        case ExecutionDomain::Remote: return "remote";
        case ExecutionDomain::Both:   return "both";
    }
    return "local";
}

const char* toString(BothModeOrder order) {
    switch (order) {
        case BothModeOrder::RemoteFirst: return "remoteFirst";
        case BothModeOrder::LocalFirst:  return "localFirst";
        case BothModeOrder::Parallel:    return "parallel";
    }
    return "remoteFirst";
}

const char* toString(MergeStrategy merge) {
    switch (merge) {
        case MergeStrategy::Last:   return "last";
        case MergeStrategy::All:    return "all";
        case MergeStrategy::Reduce: return "reduce";
    }
    return "last";
}

const char* toString(QueueOrder order) {
    return order == QueueOrder::Lifo ? "lifo" : "fifo";
}

const char* toString(ResumeMode mode) {
    return mode == ResumeMode::Manual ? "manual" : "auto";
}

std::optional<ExecutionDomain> parseExecutionDomain(std::string_view text) {
    auto s = lowered(text);
    if (s == "local") return ExecutionDomain::Local;
    if (s == "remote") return ExecutionDomain::Remote;
    if (s == "both") return ExecutionDomain::Both;
    return std::nullopt;
}

std::optional<BothModeOrder> parseBothModeOrder(std::string_view text) {
    auto s = lowered(text);
    if (s == "remotefirst") return BothModeOrder::RemoteFirst;
    if (s == "localfirst") return BothModeOrder::LocalFirst;
    if (s == "parallel") return BothModeOrder::Parallel;
    return std::nullopt;
}

std::optional<MergeStrategy> parseMergeStrategy(std::string_view text) {
    auto s = lowered(text);
    if (s == "last") return MergeStrategy::Last;
    if (s == "all") return MergeStrategy::All;
    if (s == "reduce") return MergeStrategy::Reduce;
    return std::nullopt;
}

std::optional<QueueOrder> parseQueueOrder(std::string_view text) {
    auto s = lowered(text);
    if (s == "fifo" || s == "bfs") return QueueOrder::Fifo;
    if (s == "lifo" || s == "dfs") return QueueOrder::Lifo;
    return std::nullopt;
}

std::optional<ResumeMode> parseResumeMode(std::string_view text) {
    auto s = lowered(text);
    if (s == "auto") return ResumeMode::Auto;
    if (s == "manual") return ResumeMode::Manual;
    return std::nullopt;
}

} // namespace Flow
} // namespace Core
} // namespace FlowEngine
