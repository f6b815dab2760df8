/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

#include "SharedChannel.h"
#include "../Core/WorkflowErrors.h"
#include <cstring>
#include <format>
#include <stdexcept>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    SharedChannel::SharedChannel(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("SharedChannel capacity must be greater than 0");
        }
        if (capacity > static_cast<size_t>(INT32_MAX)) {
            throw std::invalid_argument("SharedChannel capacity must fit the int32 length word");
        }
        _buffer.resize(capacity);
    }

    void SharedChannel::store(Word word, int32_t value) {
        wordRef(word).store(value, std::memory_order_release);
    }

    int32_t SharedChannel::load(Word word) const {
        return wordRef(word).load(std::memory_order_acquire);
    }

    SharedChannel::WaitResult SharedChannel::wait(Word word, int32_t expected, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(_waitMutex);
        if (load(word) != expected) {
            return WaitResult::NotEqual;
        }

        uint64_t generation = _generation;
        bool woken = _waitCV.wait_for(lock, timeout, [this, generation]() {
            return _generation != generation;
        });
        return woken ? WaitResult::Ok : WaitResult::TimedOut;
    }

    void SharedChannel::notify(Word) {
        {
            std::lock_guard<std::mutex> lock(_waitMutex);
            ++_generation;
        }
        _waitCV.notify_all();
    }

    void SharedChannel::writePayload(std::span<const uint8_t> bytes) {
        if (bytes.size() > _buffer.size()) {
            throw BridgeBufferTooSmall(bytes.size(), _buffer.size());
        }
        if (!bytes.empty()) {
            std::memcpy(_buffer.data(), bytes.data(), bytes.size());
        }
        store(Word::Length, static_cast<int32_t>(bytes.size()));
    }

    void SharedChannel::writePayload(const std::string& text) {
        writePayload(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

    std::string SharedChannel::readPayload() const {
        int32_t length = load(Word::Length);
        if (length < 0 || static_cast<size_t>(length) > _buffer.size()) {
            throw BridgeProtocolError(std::format("Length word {} outside channel capacity {}", length, _buffer.size()));
        }
        return std::string(reinterpret_cast<const char*>(_buffer.data()), static_cast<size_t>(length));
    }

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
