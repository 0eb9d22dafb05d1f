/**
 * @file progress_aggregator.h
 * @brief Single owner of upload session state
 *
 * All task and session transitions of an upload session go through the
 * progress_aggregator. Each accepted mutation produces a new immutable
 * transfer_session snapshot with a higher sequence number, which is
 * delivered to subscribed observers.
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CORE_PROGRESS_AGGREGATOR_H
#define KCENON_UPLOAD_ORCHESTRATOR_CORE_PROGRESS_AGGREGATOR_H

#include <kcenon/upload_orchestrator/core/session_types.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief Final outcome of one task in a reconciled bulk batch
 */
struct bulk_task_outcome {
    std::string task_id;
    task_status status = task_status::completed;
    std::optional<std::string> error;
};

/**
 * @brief Thread-safe aggregate of one upload session
 *
 * Guarantees, for every published snapshot:
 * - completed + failed + cancelled <= total
 * - uploaded_bytes <= total_bytes
 * - a task that reached completed, failed or cancelled never changes again
 * - sequence numbers strictly increase, and an observer never receives a
 *   snapshot older than one it has already seen
 *
 * Usage:
 * @code
 * progress_aggregator aggregator;
 * auto id = aggregator.subscribe([](const transfer_session& s) {
 *     std::cout << s.summary() << "\n";
 * });
 *
 * aggregator.begin_session(tasks, transfer_path::direct);
 * aggregator.mark_started(tasks[0].id);
 * aggregator.update_bytes(tasks[0].id, 4096);
 * aggregator.mark_completed(tasks[0].id);
 * @endcode
 */
class progress_aggregator {
public:
    using observer = std::function<void(const transfer_session&)>;
    using subscription_id = uint64_t;

    progress_aggregator();

    progress_aggregator(const progress_aggregator&) = delete;
    auto operator=(const progress_aggregator&) -> progress_aggregator& = delete;

    ~progress_aggregator();

    // Session lifecycle

    /**
     * @brief Start a new session over @p tasks
     *
     * Requires an idle aggregator. All tasks must be pending and carry
     * distinct ids. The session status becomes uploading.
     */
    auto begin_session(std::vector<file_task> tasks, transfer_path path) -> result<void>;

    /**
     * @brief Move the session to @p status
     *
     * Allowed: uploading <-> paused, uploading/paused -> cancelling,
     * uploading/paused/cancelling -> complete. Setting the current status
     * again is a no-op.
     */
    auto set_session_status(session_status status) -> result<void>;

    /**
     * @brief Return to idle with an empty session
     *
     * Rejected with session_active unless the session is idle or complete.
     */
    auto reset() -> result<void>;

    // Task transitions

    /**
     * @brief pending -> uploading (or a retry re-entering uploading)
     */
    auto mark_started(std::string_view task_id) -> result<void>;

    /**
     * @brief Record that attempt @p attempt is about to run after a failure
     *
     * Resets the task's byte progress, since a retry starts the whole file
     * over.
     */
    auto record_retry(std::string_view task_id, uint32_t attempt, std::string_view reason)
        -> result<void>;

    /**
     * @brief Report byte-level progress of an uploading task
     *
     * Values above the task size are clamped.
     */
    auto update_bytes(std::string_view task_id, uint64_t bytes_uploaded) -> result<void>;

    auto set_method(std::string_view task_id, upload_method method) -> result<void>;

    auto mark_completed(std::string_view task_id) -> result<void>;
    auto mark_failed(std::string_view task_id, std::string error_message) -> result<void>;
    auto mark_cancelled(std::string_view task_id) -> result<void>;

    /**
     * @brief Cancel every task that is not yet terminal
     *
     * Tasks of an active bulk batch keep the counts the server already
     * reported for them.
     *
     * @return Number of tasks settled
     */
    auto cancel_remaining() -> std::size_t;

    // Bulk path

    /**
     * @brief Register the server job that now owns @p task_ids
     */
    auto begin_bulk_batch(std::vector<std::string> task_ids, std::string job_id)
        -> result<void>;

    /**
     * @brief Apply a poll result of the active bulk job
     *
     * The job's counters are added provisionally on top of the counts of
     * earlier batches, clamped to the size of the active batch.
     */
    auto apply_bulk_progress(std::size_t success_count,
                             std::size_t error_count,
                             std::string_view current_file) -> result<void>;

    /**
     * @brief Apply final per-task outcomes of the active batch in one step
     *
     * Session counters never drop below the batch's provisional counts:
     * when the outcomes report fewer completed or failed tasks than the
     * last applied progress, cancelled outcomes (then the surplus of the
     * other state) are reassigned from the end of the batch.
     */
    auto reconcile_bulk_batch(const std::vector<bulk_task_outcome>& outcomes)
        -> result<void>;

    // Observation

    [[nodiscard]] auto snapshot() const -> transfer_session;

    /**
     * @brief Register an observer for every subsequent snapshot
     *
     * Observers run on the thread that performed the mutation. They may call
     * back into the aggregator.
     */
    auto subscribe(observer callback) -> subscription_id;

    void unsubscribe(subscription_id id);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CORE_PROGRESS_AGGREGATOR_H
