/**
 * @file upload_backend.h
 * @brief Server operations consumed by the upload orchestrator
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_BACKEND_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_BACKEND_H

#include <kcenon/upload_orchestrator/client/job_status.h>
#include <kcenon/upload_orchestrator/core/cancellation.h>
#include <kcenon/upload_orchestrator/core/chunk_config.h>
#include <kcenon/upload_orchestrator/core/file_source.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Server record of an uploaded file
 */
struct file_record {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string category;
    std::string content_type;
};

/**
 * @brief Metadata sent when opening a chunked upload
 */
struct chunked_upload_request {
    std::string filename;
    uint64_t size = 0;
    std::string category;
    std::string content_type;
};

/**
 * @brief Transport-level operations the orchestrator drives
 *
 * Implementations wrap the actual HTTP client. Calls may block; they are
 * issued from pool threads, several at a time. Operations taking a
 * cancellation_token should abort promptly once it is cancelled and report
 * operation_cancelled. Failures must use the error taxonomy so the retry
 * policy can tell transient errors from permanent ones.
 */
class upload_backend {
public:
    virtual ~upload_backend() = default;

    /**
     * @brief Upload one file in a single request
     */
    [[nodiscard]] virtual auto upload_single(const file_ref& file,
                                             const std::string& category,
                                             const cancellation_token& token)
        -> result<file_record> = 0;

    /**
     * @brief Open a chunked upload
     * @return Plan with upload id, chunk size (0 = client default) and chunk count
     */
    [[nodiscard]] virtual auto init_chunked(const chunked_upload_request& request,
                                            const cancellation_token& token)
        -> result<chunk_plan> = 0;

    /**
     * @brief Send one chunk, keyed by (upload id, chunk index)
     */
    [[nodiscard]] virtual auto upload_chunk(const chunk& part,
                                            const cancellation_token& token)
        -> result<void> = 0;

    /**
     * @brief Finalize a chunked upload after every chunk was accepted
     */
    [[nodiscard]] virtual auto complete_chunked(const std::string& upload_id,
                                                const cancellation_token& token)
        -> result<file_record> = 0;

    /**
     * @brief Submit a batch of files as one server-side job
     * @return Job id
     */
    [[nodiscard]] virtual auto start_bulk_job(const std::vector<file_ref>& files,
                                              const std::string& category)
        -> result<std::string> = 0;

    [[nodiscard]] virtual auto poll_bulk_job(const std::string& job_id)
        -> result<job_status> = 0;

    [[nodiscard]] virtual auto cancel_bulk_job(const std::string& job_id) -> result<void> = 0;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_BACKEND_H
