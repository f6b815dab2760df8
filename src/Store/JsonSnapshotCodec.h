/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "ISnapshotCodec.h"

namespace FlowEngine {
namespace Core {
namespace Store {

    /// JSON text snapshots via nlohmann::json; indent < 0 writes compact output
    class JsonSnapshotCodec : public ISnapshotCodec {
    public:
        explicit JsonSnapshotCodec(int indent = -1) : _indent(indent) {}

        std::string encode(const Value& snapshot) const override;
        Value decode(const std::string& text) const override;

    private:
        int _indent;
    };

} // namespace Store
} // namespace Core
} // namespace FlowEngine
