/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

/**
 * @file CoreCommon.h
 * @brief Build flags and debug helpers shared by every FlowCore module
 *
 * FLOW_ASSERT is for invariants that only a bug inside FlowCore can break.
 * Anything a caller can trigger is reported with an exception instead.
 */

#include <cassert>
#include <cstddef>

#ifdef FlowDebug
#undef NDEBUG
#define FLOW_ASSERT(condition, message) assert((condition) && message)
#else
#define FLOW_ASSERT(condition, message) ((void)0)
#endif

namespace FlowEngine {
namespace Core {
    /// Default capacity of a bridge channel payload area (2 MiB region minus the two header words)
    inline constexpr size_t DefaultChannelCapacity = 2 * 1024 * 1024 - 8;

    /// Default per-step log ring size
    inline constexpr size_t DefaultStepLogSize = 128;
}
}
