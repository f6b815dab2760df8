/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "BridgeMessages.h"
#include "../Core/ValueJson.h"
#include "../Core/WorkflowErrors.h"
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Bridge {

namespace {

    /// The field's text, nullopt when absent; any other JSON type is a protocol error
    std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw BridgeProtocolError(std::format("Bridge field '{}' must be a string, got {}", key, it->type_name()));
        }
        return it->get<std::string>();
    }

} // namespace

    std::string encodeRequest(const BridgeRequest& request) {
        nlohmann::json j;
        j["kind"] = "step";
        j["instanceId"] = request.instanceId;
        j["stepName"] = request.stepName;
        j["payload"] = toJson(request.payload);
        j["traceId"] = request.traceId;
        return j.dump();
    }

    BridgeRequest decodeRequest(std::string_view text) {
        nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            throw BridgeProtocolError("Bridge request is not a JSON object");
        }

        auto kind = stringField(j, "kind");
        if (!kind || *kind != "step") {
            throw BridgeProtocolError(std::format("Unsupported bridge request kind '{}'", kind.value_or("")));
        }
        auto stepName = stringField(j, "stepName");
        if (!stepName) {
            throw BridgeProtocolError("Bridge request has no stepName");
        }

        BridgeRequest request;
        request.instanceId = stringField(j, "instanceId").value_or("");
        request.stepName = std::move(*stepName);
        request.traceId = stringField(j, "traceId").value_or("");
        if (j.contains("payload")) {
            try {
                request.payload = fromJson(j["payload"]);
            } catch (const std::invalid_argument& e) {
                throw BridgeProtocolError(std::format("Bridge request payload: {}", e.what()));
            }
        }
        return request;
    }

    std::string encodeResponse(const BridgeResponse& response) {
        nlohmann::json j;
        if (response.ok) {
            j["kind"] = "ok";
            j["value"] = toJson(response.value);
            if (!response.logs.empty()) {
                j["logs"] = toJson(Value(response.logs));
            }
        } else {
            j["kind"] = "err";
            j["error"] = response.error;
        }
        return j.dump();
    }

    BridgeResponse decodeResponse(std::string_view text) {
        nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return BridgeResponse::failure(InvalidReplyError);
        }

        std::optional<std::string> kind;
        try {
            kind = stringField(j, "kind");
        } catch (const BridgeProtocolError& e) {
            return BridgeResponse::failure(e.what());
        }

        if (kind == "ok") {
            try {
                BridgeResponse response = BridgeResponse::success(j.contains("value") ? fromJson(j["value"]) : Value());
                if (j.contains("logs") && j["logs"].is_array()) {
                    response.logs = fromJson(j["logs"]).asArray();
                }
                return response;
            } catch (const std::invalid_argument&) {
                return BridgeResponse::failure(InvalidReplyError);
            }
        }
        if (kind == "err") {
            try {
                return BridgeResponse::failure(stringField(j, "error").value_or("Remote step failed"));
            } catch (const BridgeProtocolError& e) {
                return BridgeResponse::failure(e.what());
            }
        }
        return BridgeResponse::failure(std::format("Unknown reply kind '{}'", kind.value_or("")));
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
