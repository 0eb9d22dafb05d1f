/**
 * @file job_status.h
 * @brief Typed status of a server-side bulk upload job
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_JOB_STATUS_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_JOB_STATUS_H

#include <kcenon/upload_orchestrator/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Server-side state of a bulk job
 */
enum class job_state {
    queued,
    processing,
    completed,
    completed_with_errors,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(job_state s) -> const char* {
    switch (s) {
        case job_state::queued: return "queued";
        case job_state::processing: return "processing";
        case job_state::completed: return "completed";
        case job_state::completed_with_errors: return "completed_with_errors";
        case job_state::failed: return "failed";
        case job_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse the wire name of a job state
 */
[[nodiscard]] auto parse_job_state(std::string_view name) -> std::optional<job_state>;

[[nodiscard]] constexpr auto is_terminal(job_state s) -> bool {
    return s == job_state::completed || s == job_state::completed_with_errors ||
           s == job_state::failed || s == job_state::cancelled;
}

/**
 * @brief One "<filename>: <message>" entry of a job's error list
 */
struct job_error_entry {
    std::string filename;
    std::string message;
};

/**
 * @brief Split an error entry at its first colon
 *
 * Both parts are trimmed. An entry without a colon is treated as a bare
 * file name with an empty message.
 */
[[nodiscard]] auto parse_job_error(std::string_view entry) -> job_error_entry;

/**
 * @brief Status of a bulk job as reported by one poll
 */
struct job_status {
    job_state status = job_state::queued;
    std::optional<double> progress;
    std::optional<std::size_t> total;
    std::optional<std::string> current_file;
    std::size_t success_count = 0;
    std::size_t error_count = 0;
    std::vector<std::string> errors;

    [[nodiscard]] auto is_terminal() const -> bool {
        return upload_orchestrator::is_terminal(status);
    }

    [[nodiscard]] auto failed_files() const -> std::vector<job_error_entry>;
};

/**
 * @brief Deserialize a job status payload
 *
 * Expected shape:
 * @code
 * {
 *   "status": "processing",
 *   "progress": 45.0,
 *   "total": 20,
 *   "current_file": "report.pdf",
 *   "success_count": 9,
 *   "error_count": 0,
 *   "errors": ["a.pdf: unsupported format"]
 * }
 * @endcode
 * `status`, `success_count` and `error_count` are required; the other
 * fields may be absent or null.
 *
 * @return Parsed status, or invalid_job_status
 */
[[nodiscard]] auto parse_job_status(std::string_view json) -> result<job_status>;

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_JOB_STATUS_H
