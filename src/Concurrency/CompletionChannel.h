/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace Ferry {
namespace Core {
namespace Concurrency {

    /**
     * @brief Unbounded multi-producer, single-consumer queue
     *
     * Worker contracts push results; one aggregator thread pops them. pop()
     * blocks until a message arrives.
     */
    template<class T>
    class CompletionChannel {
    public:
        void push(T message) {
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _messages.push_back(std::move(message));
            }
            _available.notify_one();
        }

        T pop() {
            std::unique_lock<std::mutex> lock(_mutex);
            _available.wait(lock, [this] { return !_messages.empty(); });
            T message = std::move(_messages.front());
            _messages.pop_front();
            return message;
        }

        std::optional<T> tryPop() {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_messages.empty()) return std::nullopt;
            T message = std::move(_messages.front());
            _messages.pop_front();
            return message;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _messages.size();
        }

    private:
        mutable std::mutex _mutex;
        std::condition_variable _available;
        std::deque<T> _messages;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
