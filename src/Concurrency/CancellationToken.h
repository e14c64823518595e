/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

/**
 * @file CancellationToken.h
 * @brief Shared abort signal for long-running work
 *
 * A CancellationSource owns the flag; any number of CancellationTokens observe it.
 * Tokens are cheap to copy and safe to poll from any thread. A default-constructed
 * token is never cancelled.
 *
 * @code
 * CancellationSource source;
 * auto token = source.token();
 * // worker
 * while (!token.isCancelled()) { processChunk(); }
 * // control path
 * source.cancel();
 * @endcode
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace Ferry {
namespace Core {
namespace Concurrency {

namespace detail {
    struct CancellationState {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
}

class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const noexcept {
        return _state && _state->cancelled.load(std::memory_order_acquire);
    }

    bool canBeCancelled() const noexcept { return static_cast<bool>(_state); }

    /**
     * @brief Sleeps for up to @p duration, returning early if cancellation is requested
     * @return true if the token was cancelled before or during the wait
     */
    template<class Rep, class Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) const {
        if (!_state) {
            std::this_thread::sleep_for(duration);
            return false;
        }
        std::unique_lock<std::mutex> lock(_state->mutex);
        return _state->cv.wait_for(lock, duration, [this] {
            return _state->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : _state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> _state;
};

class CancellationSource {
public:
    CancellationSource() : _state(std::make_shared<detail::CancellationState>()) {}

    /**
     * @brief Requests cancellation; idempotent
     */
    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lock(_state->mutex);
            _state->cancelled.store(true, std::memory_order_release);
        }
        _state->cv.notify_all();
    }

    bool isCancelled() const noexcept { return _state->cancelled.load(std::memory_order_acquire); }

    CancellationToken token() const { return CancellationToken(_state); }

private:
    std::shared_ptr<detail::CancellationState> _state;
};

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
