/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file BridgeMessages.h
 * @brief Request and response records exchanged across the shared channel
 *
 * On the wire both are JSON objects:
 *
 *   Request:  {"kind":"step","instanceId":...,"stepName":...,"payload":...,"traceId":...}
 *   Response: {"kind":"ok","value":...,"logs":[...]} | {"kind":"err","error":"..."}
 */

#pragma once

#include "../Core/Value.h"
#include <string>
#include <string_view>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    struct BridgeRequest {
        std::string instanceId;
        std::string stepName;
        Value payload;
        std::string traceId;
    };

    struct BridgeResponse {
        bool ok = false;
        Value value;          ///< Step output when ok
        Value::Array logs;    ///< Step log entries the remote side produced, when ok
        std::string error;    ///< Failure text when !ok

        static BridgeResponse success(Value value, Value::Array logs = {}) {
            BridgeResponse r;
            r.ok = true;
            r.value = std::move(value);
            r.logs = std::move(logs);
            return r;
        }

        static BridgeResponse failure(std::string error) {
            BridgeResponse r;
            r.error = std::move(error);
            return r;
        }
    };

    /// Reply text used when the remote side answers with something that is not JSON
    inline constexpr const char* InvalidReplyError = "Invalid JSON from remote";

    std::string encodeRequest(const BridgeRequest& request);

    /// @throws BridgeProtocolError if the text is not a well-formed step request
    BridgeRequest decodeRequest(std::string_view text);

    std::string encodeResponse(const BridgeResponse& response);

    /**
     * @brief Parses a reply
     *
     * Never throws. Malformed JSON, or JSON without a recognized kind, becomes
     * an err response so the executor sees an ordinary remote failure.
     */
    BridgeResponse decodeResponse(std::string_view text);

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
