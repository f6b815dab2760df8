/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Flow Core project.
 */

/**
 * @file SharedChannel.h
 * @brief Fixed-size byte region with a lock word and a length word
 *
 * The single slot over which the bridge hands a request to the remote worker
 * and receives the reply. Layout mirrors a shared memory block:
 *
 *   [lockWord:int32][lengthWord:int32][payloadBytes ... capacity]
 *
 * The words are atomics. wait()/notify() on the lock word are built from a
 * mutex and condition variable with a generation counter, giving the same
 * "sleep until someone notifies or the timeout passes" behavior as a futex.
 */

#pragma once

#include "../CoreCommon.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace FlowEngine {
namespace Core {
namespace Bridge {

    /**
     * @brief The shared memory primitive under the bridge
     *
     * @code
     * SharedChannel channel(1024);
     *
     * // caller side
     * channel.writePayload(requestBytes);
     * channel.store(SharedChannel::Word::Lock, 0);
     * // ...wake the worker...
     * channel.wait(SharedChannel::Word::Lock, 0, std::chrono::milliseconds(15000));
     * int32_t signal = channel.load(SharedChannel::Word::Lock);
     *
     * // worker side
     * channel.writePayload(replyBytes);
     * channel.store(SharedChannel::Word::Lock, requestId);
     * channel.notify(SharedChannel::Word::Lock);
     * @endcode
     */
    class SharedChannel {
    public:
        enum class Word : uint8_t {
            Lock = 0,
            Length = 1
        };

        enum class WaitResult : uint8_t {
            Ok,         ///< Woken by notify()
            NotEqual,   ///< The word already differed from the expected value
            TimedOut
        };

        /// @throws std::invalid_argument if capacity is 0
        explicit SharedChannel(size_t capacity = DefaultChannelCapacity);

        SharedChannel(const SharedChannel&) = delete;
        SharedChannel& operator=(const SharedChannel&) = delete;

        void store(Word word, int32_t value);
        int32_t load(Word word) const;

        /**
         * @brief Sleeps while the word holds the expected value
         *
         * Returns NotEqual at once if the word already differs. Otherwise
         * returns Ok when notify() is called on this channel, or TimedOut.
         * An Ok wake does not promise the word changed; callers re-check it.
         */
        WaitResult wait(Word word, int32_t expected, std::chrono::milliseconds timeout);

        /// Wakes every waiter on the channel
        void notify(Word word);

        /**
         * @brief Copies bytes into the payload region and sets the length word
         * @throws BridgeBufferTooSmall if the bytes do not fit
         */
        void writePayload(std::span<const uint8_t> bytes);
        void writePayload(const std::string& text);

        /**
         * @brief Copies out lengthWord bytes of payload
         * @throws BridgeProtocolError if the length word is negative or exceeds capacity
         */
        std::string readPayload() const;

        size_t capacity() const { return _buffer.size(); }

    private:
        std::atomic<int32_t>& wordRef(Word word) { return _words[static_cast<size_t>(word)]; }
        const std::atomic<int32_t>& wordRef(Word word) const { return _words[static_cast<size_t>(word)]; }

        std::atomic<int32_t> _words[2] = {0, 0};
        std::vector<uint8_t> _buffer;

        std::mutex _waitMutex;
        std::condition_variable _waitCV;
        uint64_t _generation = 0;
    };

} // namespace Bridge
} // namespace Core
} // namespace FlowEngine
