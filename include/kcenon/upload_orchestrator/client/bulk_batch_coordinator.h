/**
 * @file bulk_batch_coordinator.h
 * @brief Sequential server-side batch jobs for large submissions
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_BULK_BATCH_COORDINATOR_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_BULK_BATCH_COORDINATOR_H

#include <kcenon/upload_orchestrator/client/job_status.h>
#include <kcenon/upload_orchestrator/client/orchestrator_config.h>
#include <kcenon/upload_orchestrator/client/upload_backend.h>
#include <kcenon/upload_orchestrator/core/progress_aggregator.h>
#include <kcenon/upload_orchestrator/core/transfer_control.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief One file handed to the bulk path
 */
struct bulk_task {
    std::string task_id;
    file_ref file;
};

/**
 * @brief Half-open range [begin, end) of task indexes forming one batch
 */
struct batch_range {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] auto size() const -> std::size_t { return end - begin; }
};

/**
 * @brief Uploads files as server-side jobs, one batch at a time
 *
 * Batch N+1 is submitted only after batch N's job reached a terminal state
 * (or was cancelled). While a job runs, its counters are reported to the
 * aggregator on top of the totals of earlier batches. Poll failures are
 * logged and the poll repeated until the job finishes or the session is
 * cancelled.
 */
class bulk_batch_coordinator {
public:
    bulk_batch_coordinator(std::shared_ptr<upload_backend> backend,
                           std::shared_ptr<progress_aggregator> aggregator,
                           std::shared_ptr<transfer_control> control,
                           bulk_config config,
                           std::string category);

    /**
     * @brief Run every batch and block until all tasks are terminal
     */
    void run(const std::vector<bulk_task>& tasks);

    /**
     * @brief Split @p count tasks into consecutive batches of @p batch_size
     */
    [[nodiscard]] static auto make_batches(std::size_t count, std::size_t batch_size)
        -> std::vector<batch_range>;

    /**
     * @brief Decide the final status of every task of a batch
     *
     * Each entry of the job's error list fails one task with that name (or
     * with the entry's last path component), in submission order. Of the
     * remaining tasks, the first success_count complete. If error_count
     * exceeds the matched entries, the next unaccounted tasks fail as well.
     * The rest follow the job state: completed for completed and
     * completed_with_errors, failed for failed, cancelled for cancelled.
     * When no terminal status is known (the session was cancelled while the
     * job ran) the rest are cancelled.
     */
    [[nodiscard]] static auto reconcile(const std::vector<bulk_task>& batch,
                                        const std::optional<job_status>& status)
        -> std::vector<bulk_task_outcome>;

private:
    void run_batch(const std::vector<bulk_task>& batch, std::size_t batch_index);
    auto poll_until_terminal(const std::string& job_id) -> std::optional<job_status>;
    auto poll_once(const std::string& job_id) -> std::optional<job_status>;
    void cancel_job(const std::string& job_id, std::optional<job_status>& last);
    void mark_batch(const std::vector<bulk_task>& batch, task_status status,
                    const std::string& message);

    std::shared_ptr<upload_backend> backend_;
    std::shared_ptr<progress_aggregator> aggregator_;
    std::shared_ptr<transfer_control> control_;
    bulk_config config_;
    std::string category_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_BULK_BATCH_COORDINATOR_H
