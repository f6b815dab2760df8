/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "JsonSnapshotCodec.h"
#include "../Core/ValueJson.h"
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Store {

std::string JsonSnapshotCodec::encode(const Value& snapshot) const {
    return toJson(snapshot).dump(_indent);
}

Value JsonSnapshotCodec::decode(const std::string& text) const {
    Value decoded = parseJsonString(text);
    if (!decoded.isObject()) {
        throw std::invalid_argument("Snapshot text must hold a JSON object");
    }
    return decoded;
}

} // namespace Store
} // namespace Core
} // namespace FlowEngine
