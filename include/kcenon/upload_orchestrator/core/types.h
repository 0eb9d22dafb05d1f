/**
 * @file types.h
 * @brief Core error and result types for upload_orchestrator
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_TYPES_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::upload_orchestrator {

/**
 * @brief Error codes for upload orchestration (-900 to -999)
 *
 * Error code ranges:
 * - -900 to -909: Transient errors (retried)
 * - -910:         Cancellation
 * - -920 to -929: Permanent errors
 * - -930 to -939: Coordination errors (bulk job plumbing)
 * - -940 to -959: Configuration and state errors
 */
enum class error_code : int32_t {
    success = 0,

    // Transient errors (-900 to -909)
    network_error = -900,
    server_error = -901,
    request_timeout = -902,
    service_unavailable = -903,
    rate_limited = -904,

    // Cancellation (-910)
    operation_cancelled = -910,

    // Permanent errors (-920 to -929)
    validation_failed = -920,
    request_rejected = -921,
    file_not_found = -922,
    file_read_error = -923,
    invalid_chunk_plan = -924,
    retries_exhausted = -925,

    // Coordination errors (-930 to -939)
    job_submit_failed = -930,
    job_poll_failed = -931,
    job_cancel_failed = -932,
    invalid_job_status = -933,

    // Configuration and state errors (-940 to -959)
    invalid_configuration = -940,
    not_initialized = -941,
    session_active = -942,
    no_active_session = -943,
    invalid_state_transition = -944,
    operation_not_supported = -945,
    internal_error = -950,
};

/**
 * @brief Error taxonomy used for retry and reporting decisions
 */
enum class error_category {
    none,
    transient,
    cancellation,
    permanent,
    coordination,
    configuration
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::network_error:
            return "network error";
        case error_code::server_error:
            return "server error";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::rate_limited:
            return "rate limited";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::validation_failed:
            return "validation failed";
        case error_code::request_rejected:
            return "request rejected";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::invalid_chunk_plan:
            return "invalid chunk plan";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::job_submit_failed:
            return "bulk job submission failed";
        case error_code::job_poll_failed:
            return "bulk job poll failed";
        case error_code::job_cancel_failed:
            return "bulk job cancellation failed";
        case error_code::invalid_job_status:
            return "invalid bulk job status";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::session_active:
            return "upload session already active";
        case error_code::no_active_session:
            return "no active upload session";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::operation_not_supported:
            return "operation not supported";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code onto the error taxonomy
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    auto value = static_cast<int32_t>(code);
    if (value == 0) return error_category::none;
    if (value <= -900 && value >= -909) return error_category::transient;
    if (value == -910) return error_category::cancellation;
    if (value <= -920 && value >= -929) return error_category::permanent;
    if (value <= -930 && value >= -939) return error_category::coordination;
    return error_category::configuration;
}

[[nodiscard]] constexpr auto to_string(error_category category) noexcept -> const char* {
    switch (category) {
        case error_category::none: return "none";
        case error_category::transient: return "transient";
        case error_category::cancellation: return "cancellation";
        case error_category::permanent: return "permanent";
        case error_category::coordination: return "coordination";
        case error_category::configuration: return "configuration";
        default: return "unknown";
    }
}

/**
 * @brief Check whether an error is worth another attempt
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return category_of(code) == error_category::transient;
}

[[nodiscard]] constexpr auto is_cancellation(error_code code) noexcept -> bool {
    return category_of(code) == error_category::cancellation;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    [[nodiscard]] auto category() const noexcept -> error_category {
        return category_of(code);
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_TYPES_H
