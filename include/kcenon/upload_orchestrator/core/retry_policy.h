// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file retry_policy.h
 * @brief Bounded retry with linear back-off for whole-file upload attempts
 */

#pragma once

#include "kcenon/upload_orchestrator/core/cancellation.h"
#include "kcenon/upload_orchestrator/core/logging.h"
#include "kcenon/upload_orchestrator/core/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>

namespace kcenon::upload_orchestrator {

/**
 * @brief Retry configuration
 */
struct retry_config {
    /// Retries after the first attempt (2 retries = up to 3 attempts)
    uint32_t max_retries = 2;

    /// Delay unit; the wait before retry n is base_delay * n
    std::chrono::milliseconds base_delay{1000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (base_delay.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry base delay must not be negative"});
        }
        return {};
    }

    [[nodiscard]] auto max_attempts() const -> uint32_t { return max_retries + 1; }
};

/**
 * @brief Wraps one upload operation with bounded retry
 *
 * Only transient errors are retried. A cancellation observed before an
 * attempt, during back-off, or reported by the attempt itself ends the
 * sequence immediately with operation_cancelled.
 *
 * @code
 * retry_policy policy(config.retry);
 * auto res = policy.execute(
 *     [&](uint32_t attempt) { return backend->upload_single(file, category, token); },
 *     token);
 * @endcode
 */
class retry_policy {
public:
    /// Called before each back-off with (next attempt number, error that caused it)
    using retry_callback = std::function<void(uint32_t, const error&)>;

    retry_policy() = default;
    explicit retry_policy(retry_config config) : config_(config) {}

    [[nodiscard]] auto config() const -> const retry_config& { return config_; }

    /**
     * @brief Delay before retry number @p retry_number (1-based)
     */
    [[nodiscard]] auto delay_for(uint32_t retry_number) const -> std::chrono::milliseconds {
        return config_.base_delay * retry_number;
    }

    /**
     * @brief Run @p operation until it succeeds, fails permanently, or retries run out
     *
     * @param operation Callable taking the 1-based attempt number and returning result<T>
     * @param token Session cancellation token
     * @param on_retry Optional hook invoked before every back-off
     */
    template <typename Operation>
    auto execute(Operation&& operation,
                 const cancellation_token& token,
                 const retry_callback& on_retry = {})
        -> std::invoke_result_t<Operation&, uint32_t> {
        using result_type = std::invoke_result_t<Operation&, uint32_t>;

        error last_error{error_code::operation_cancelled};
        for (uint32_t attempt = 1; attempt <= config_.max_attempts(); ++attempt) {
            if (token.is_cancellation_requested()) {
                return result_type(unexpected(error{error_code::operation_cancelled}));
            }

            auto res = operation(attempt);
            if (res) {
                return res;
            }

            last_error = res.error();
            if (is_cancellation(last_error.code) || token.is_cancellation_requested()) {
                return result_type(unexpected(error{error_code::operation_cancelled}));
            }

            if (!is_retryable(last_error.code)) {
                return res;
            }

            if (attempt == config_.max_attempts()) {
                break;
            }

            auto delay = delay_for(attempt);
            if (get_logger().is_enabled(log_level::debug)) {
                upload_log_context ctx;
                ctx.attempt = attempt;
                ctx.error_message = last_error.message;
                UO_LOG_DEBUG_CTX(log_category::retry,
                                 "Attempt failed, retrying in " +
                                     std::to_string(delay.count()) + "ms",
                                 ctx);
            }

            if (on_retry) {
                on_retry(attempt + 1, last_error);
            }

            if (token.wait_for(delay)) {
                return result_type(unexpected(error{error_code::operation_cancelled}));
            }
        }

        return result_type(unexpected(std::move(last_error)));
    }

private:
    retry_config config_;
};

}  // namespace kcenon::upload_orchestrator
