/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file WorkflowErrors.h
 * @brief Exception types raised by the scheduler, executor and bridge
 *
 * Everything derives from WorkflowError so callers that only care whether a
 * workflow operation failed can catch one type. The bridge errors are split
 * finely because the executor treats them differently: a timeout is a failed
 * attempt that may be retried, while a protocol or transport fault makes the
 * step fall back to running in-process.
 */

#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>

namespace FlowEngine {
namespace Core {

    class WorkflowError : public std::runtime_error {
    public:
        explicit WorkflowError(const std::string& message)
            : std::runtime_error(message) {}
    };

    /// A step effect (or a remote side reporting "err") failed
    class EffectFailure : public WorkflowError {
    public:
        explicit EffectFailure(const std::string& message)
            : WorkflowError(message) {}
    };

    /// Base of every cross-domain call failure
    class BridgeError : public WorkflowError {
    public:
        explicit BridgeError(const std::string& message)
            : WorkflowError(message) {}
    };

    /// No reply arrived within the configured timeout
    class BridgeTimeout : public BridgeError {
    public:
        explicit BridgeTimeout(const std::string& message)
            : BridgeError(message) {}
    };

    /// The reply signal did not match the request id, or the reply was not decodable
    class BridgeProtocolError : public BridgeError {
    public:
        explicit BridgeProtocolError(const std::string& message)
            : BridgeError(message) {}
    };

    /// The remote side could not be reached at all
    class BridgeTransportError : public BridgeError {
    public:
        explicit BridgeTransportError(const std::string& message)
            : BridgeError(message) {}
    };

    /// Request or reply does not fit the shared channel
    class BridgeBufferTooSmall : public BridgeProtocolError {
    public:
        BridgeBufferTooSmall(size_t required, size_t capacity)
            : BridgeProtocolError(std::format("Shared buffer too small: need {} bytes, have {}", required, capacity))
            , _required(required)
            , _capacity(capacity) {}

        size_t required() const { return _required; }
        size_t capacity() const { return _capacity; }

    private:
        size_t _required;
        size_t _capacity;
    };

    /// A snapshot asked for a feature the codec cannot persist
    class SerializationUnsupported : public WorkflowError {
    public:
        explicit SerializationUnsupported(const std::string& message)
            : WorkflowError(message) {}
    };

} // namespace Core
} // namespace FlowEngine
