// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file cancellation.h
 * @brief Cooperative cancellation primitives for upload sessions
 *
 * A cancellation_source is owned by the party allowed to cancel (the
 * orchestrator session). Any number of cancellation_token copies observe it:
 * workers poll the token between units of work, sleep on it during retry
 * back-off, and register callbacks to abort blocking I/O.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace kcenon::upload_orchestrator {

namespace detail {
struct cancellation_state;
}  // namespace detail

/**
 * @brief Read-only view of a cancellation request
 *
 * A default-constructed token is never cancelled.
 */
class cancellation_token {
public:
    using callback_id = uint64_t;

    cancellation_token() = default;

    [[nodiscard]] auto is_cancellation_requested() const -> bool;

    /**
     * @brief Sleep for up to @p timeout, waking early on cancellation
     * @return true if cancellation was requested before the timeout elapsed
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Register a callback invoked once when cancellation is requested
     *
     * If cancellation has already been requested the callback runs
     * synchronously before this returns.
     *
     * @return Id for unregister_callback, or 0 if the callback already ran
     */
    auto register_callback(std::function<void()> callback) const -> callback_id;

    void unregister_callback(callback_id id) const;

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief Owner side of a cancellation request
 */
class cancellation_source {
public:
    cancellation_source();

    /**
     * @brief Request cancellation
     *
     * Idempotent. Wakes every token blocked in wait_for() and runs the
     * registered callbacks on the calling thread.
     */
    void request_cancellation();

    [[nodiscard]] auto is_cancellation_requested() const -> bool;

    [[nodiscard]] auto get_token() const -> cancellation_token;

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

}  // namespace kcenon::upload_orchestrator
