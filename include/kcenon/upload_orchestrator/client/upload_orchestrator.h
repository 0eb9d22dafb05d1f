/**
 * @file upload_orchestrator.h
 * @brief Caller-facing entry point of the upload orchestration engine
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_ORCHESTRATOR_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_ORCHESTRATOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/upload_orchestrator/client/orchestrator_config.h"
#include "kcenon/upload_orchestrator/client/upload_backend.h"
#include "kcenon/upload_orchestrator/core/progress_aggregator.h"
#include "kcenon/upload_orchestrator/core/session_types.h"
#include "kcenon/upload_orchestrator/core/types.h"

namespace kcenon::upload_orchestrator {

/**
 * @brief Uploads a multi-file submission and exposes its live progress
 *
 * Each call to start_upload() creates one session. Small submissions are
 * uploaded file by file with bounded concurrency (large files in chunks),
 * large submissions are handed to the server as sequential batch jobs.
 * The session runs in the background; callers follow it through
 * snapshot() or subscribe() and steer it with pause(), resume() and
 * cancel(). Once complete, dismiss() clears it for the next submission.
 *
 * Usage:
 * @code
 * auto orchestrator = upload_orchestrator::builder()
 *     .with_backend(backend)
 *     .with_concurrency(5)
 *     .with_category("reports")
 *     .build();
 *
 * if (orchestrator) {
 *     orchestrator->subscribe([](const transfer_session& s) {
 *         std::cout << s.summary() << "\n";
 *     });
 *     auto files = std::vector<file_ref>{...};
 *     orchestrator->start_upload(files);
 *     auto final_state = orchestrator->wait();
 * }
 * @endcode
 */
class upload_orchestrator {
public:
    using observer = progress_aggregator::observer;
    using subscription_id = progress_aggregator::subscription_id;

    /**
     * @brief Builder for upload_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Submissions with at most @p count files use the direct path
         */
        auto with_direct_threshold(std::size_t count) -> builder&;

        /**
         * @brief Number of files uploaded simultaneously on the direct path
         */
        auto with_concurrency(std::size_t workers) -> builder&;

        /**
         * @brief Files of at least @p bytes are uploaded in chunks
         */
        auto with_chunk_threshold(uint64_t bytes) -> builder&;

        auto with_chunk_size(std::size_t bytes) -> builder&;

        auto with_chunk_concurrency(std::size_t chunks) -> builder&;

        auto with_max_retries(uint32_t retries) -> builder&;

        auto with_retry_base_delay(std::chrono::milliseconds delay) -> builder&;

        auto with_bulk_batch_size(std::size_t files) -> builder&;

        auto with_poll_interval(std::chrono::milliseconds interval) -> builder&;

        auto with_category(std::string category) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(orchestrator_config config) -> builder&;

        /**
         * @brief Server operations used for every upload (required)
         */
        auto with_backend(std::shared_ptr<upload_backend> backend) -> builder&;

        /**
         * @brief Build the orchestrator
         * @return orchestrator, or invalid_configuration / not_initialized
         */
        [[nodiscard]] auto build() -> result<upload_orchestrator>;

    private:
        orchestrator_config config_;
        std::shared_ptr<upload_backend> backend_;
    };

    // Non-copyable, movable
    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;
    upload_orchestrator(upload_orchestrator&&) noexcept;
    auto operator=(upload_orchestrator&&) noexcept -> upload_orchestrator&;

    /**
     * @brief Cancels a running session and waits for it to finish
     */
    ~upload_orchestrator();

    // Session control

    /**
     * @brief Start uploading @p files in the background
     *
     * @return validation_failed for an empty list or a file without data,
     *         session_active while a previous session is not dismissed
     */
    [[nodiscard]] auto start_upload(std::vector<file_ref> files) -> result<void>;

    /**
     * @brief Stop picking up new files; uploads in flight finish
     *
     * Only the direct path can be paused; on the bulk path this returns
     * operation_not_supported.
     */
    [[nodiscard]] auto pause() -> result<void>;

    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Cancel the session
     *
     * In-flight requests are aborted, queued files and unsent batches are
     * cancelled, and a running server job is asked to stop. The session
     * moves to cancelling and then to complete.
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Clear a finished session
     * @return session_active while the session is still running
     */
    [[nodiscard]] auto dismiss() -> result<void>;

    // Observation

    [[nodiscard]] auto snapshot() const -> transfer_session;

    auto subscribe(observer callback) -> subscription_id;

    void unsubscribe(subscription_id id);

    /**
     * @brief Whether a session still accepts pause, resume and cancel
     *
     * Already false when observers receive the complete snapshot.
     */
    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Block until the current session completes
     *
     * A session started by an observer of the complete snapshot is waited
     * for as well.
     * @return Final snapshot (the current one when nothing is running)
     */
    auto wait() -> transfer_session;

    /**
     * @brief Block until the current session completes or @p timeout elapses
     * @return Final snapshot, or request_timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> result<transfer_session>;

    [[nodiscard]] auto config() const -> const orchestrator_config&;

private:
    upload_orchestrator(orchestrator_config config, std::shared_ptr<upload_backend> backend);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_UPLOAD_ORCHESTRATOR_H
