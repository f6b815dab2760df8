/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#pragma once

#include "../Core/Value.h"
#include <memory>
#include <string>

namespace FlowEngine {
namespace Core {
namespace Store {

    /**
     * @brief Turns snapshot Values into portable text and back
     *
     * Workflow::serialize() builds a Value describing the instance and hands it
     * to the engine's codec. Engines constructed without a codec refuse to
     * serialize at all.
     */
    class ISnapshotCodec {
    public:
        virtual ~ISnapshotCodec() = default;

        virtual std::string encode(const Value& snapshot) const = 0;

        /// @throws std::invalid_argument if the text is not a snapshot this codec wrote
        virtual Value decode(const std::string& text) const = 0;
    };

    using SnapshotCodecPtr = std::shared_ptr<ISnapshotCodec>;

} // namespace Store
} // namespace Core
} // namespace FlowEngine
