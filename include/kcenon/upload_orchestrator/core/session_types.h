/**
 * @file session_types.h
 * @brief Task and session state exposed to observers
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_SESSION_TYPES_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_SESSION_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Lifecycle of a single file task
 *
 * pending -> uploading -> {completed | failed | cancelled}. A pending task
 * may also go straight to cancelled or failed when it never gets sent.
 */
enum class task_status {
    pending,
    uploading,
    completed,
    failed,
    cancelled
};

/**
 * @brief Lifecycle of an upload session
 */
enum class session_status {
    idle,
    uploading,
    paused,
    cancelling,
    complete
};

/**
 * @brief Strategy chosen for a session
 */
enum class transfer_path {
    none,
    direct,  ///< Concurrent per-file uploads from the client
    bulk     ///< Sequential server-side batch jobs
};

/**
 * @brief How a direct-path file is sent
 */
enum class upload_method {
    single,   ///< One request carrying the whole file
    chunked   ///< init / chunk x N / complete
};

[[nodiscard]] constexpr auto to_string(task_status s) -> const char* {
    switch (s) {
        case task_status::pending: return "pending";
        case task_status::uploading: return "uploading";
        case task_status::completed: return "completed";
        case task_status::failed: return "failed";
        case task_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto to_string(session_status s) -> const char* {
    switch (s) {
        case session_status::idle: return "idle";
        case session_status::uploading: return "uploading";
        case session_status::paused: return "paused";
        case session_status::cancelling: return "cancelling";
        case session_status::complete: return "complete";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto to_string(transfer_path p) -> const char* {
    switch (p) {
        case transfer_path::none: return "none";
        case transfer_path::direct: return "direct";
        case transfer_path::bulk: return "bulk";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto to_string(upload_method m) -> const char* {
    switch (m) {
        case upload_method::single: return "single";
        case upload_method::chunked: return "chunked";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(task_status s) -> bool {
    return s == task_status::completed || s == task_status::failed ||
           s == task_status::cancelled;
}

/**
 * @brief One file's transfer unit within a session
 */
struct file_task {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string content_type;
    task_status status = task_status::pending;
    std::optional<std::string> error;
    uint64_t bytes_uploaded = 0;
    uint32_t attempts = 0;
    upload_method method = upload_method::single;

    [[nodiscard]] auto is_terminal() const -> bool {
        return upload_orchestrator::is_terminal(status);
    }
};

/**
 * @brief Immutable snapshot of an upload session
 */
struct transfer_session {
    /// Increases by one with every published change
    uint64_t sequence = 0;

    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;

    uint64_t total_bytes = 0;
    uint64_t uploaded_bytes = 0;

    session_status status = session_status::idle;
    transfer_path path = transfer_path::none;
    std::string current_file_name;
    std::optional<std::string> bulk_job_id;

    std::vector<file_task> files;

    [[nodiscard]] auto processed() const -> std::size_t {
        return completed + failed + cancelled;
    }

    [[nodiscard]] auto remaining() const -> std::size_t {
        return total - processed();
    }

    /**
     * @brief Share of files that reached completed or failed, 0..100
     */
    [[nodiscard]] auto completion_percentage() const -> double;

    /**
     * @brief Share of bytes uploaded, 0..100
     */
    [[nodiscard]] auto byte_percentage() const -> double;

    [[nodiscard]] auto all_succeeded() const -> bool {
        return status == session_status::complete && failed == 0 && cancelled == 0 &&
               completed == total;
    }

    [[nodiscard]] auto failed_tasks() const -> std::vector<file_task>;

    [[nodiscard]] auto find(std::string_view task_id) const -> const file_task*;

    [[nodiscard]] auto count(task_status s) const -> std::size_t;

    /**
     * @brief One-line status description for display
     *
     * e.g. "Uploading 3/10...", "Done: 8 uploaded, 2 failed".
     */
    [[nodiscard]] auto summary() const -> std::string;
};

/**
 * @brief Format a byte count for display ("1.5 MB")
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_SESSION_TYPES_H
