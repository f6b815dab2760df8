/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "IRemoteTransport.h"
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    InProcessTransport::InProcessTransport(Handler handler)
        : _handler(std::move(handler)) {
        if (!_handler) {
            throw std::invalid_argument("InProcessTransport requires a handler");
        }
    }

    std::string InProcessTransport::send(const std::string&, const std::string& body, const Headers&) {
        return _handler(body);
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
