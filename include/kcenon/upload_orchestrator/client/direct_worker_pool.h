/**
 * @file direct_worker_pool.h
 * @brief Bounded-concurrency execution of direct-path upload tasks
 */

#ifndef KCENON_UPLOAD_ORCHESTRATOR_CLIENT_DIRECT_WORKER_POOL_H
#define KCENON_UPLOAD_ORCHESTRATOR_CLIENT_DIRECT_WORKER_POOL_H

#include <kcenon/upload_orchestrator/adapters/thread_pool_adapter.h>
#include <kcenon/upload_orchestrator/client/chunked_uploader.h>
#include <kcenon/upload_orchestrator/client/orchestrator_config.h>
#include <kcenon/upload_orchestrator/client/upload_backend.h>
#include <kcenon/upload_orchestrator/core/progress_aggregator.h>
#include <kcenon/upload_orchestrator/core/retry_policy.h>
#include <kcenon/upload_orchestrator/core/transfer_control.h>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator {

/**
 * @brief One file queued on the direct path
 */
struct direct_task {
    std::string task_id;
    file_ref file;
    upload_method method = upload_method::single;
};

/**
 * @brief Runs direct-path tasks with at most worker_pool_config::max_concurrent in flight
 *
 * Workers pull from one FIFO queue. Before taking a task a worker waits
 * while the session is paused, and stops pulling once it is cancelled.
 * Each task is one retried upload (single request or chunked), and every
 * transition is reported to the aggregator as it happens.
 */
class direct_worker_pool {
public:
    direct_worker_pool(std::shared_ptr<upload_backend> backend,
                       std::shared_ptr<adapters::upload_thread_pool_interface> worker_threads,
                       std::shared_ptr<adapters::upload_thread_pool_interface> chunk_threads,
                       std::shared_ptr<progress_aggregator> aggregator,
                       std::shared_ptr<transfer_control> control,
                       orchestrator_config config);

    direct_worker_pool(const direct_worker_pool&) = delete;
    auto operator=(const direct_worker_pool&) -> direct_worker_pool& = delete;

    /**
     * @brief Execute @p tasks and block until every one is terminal
     *
     * Tasks still queued when the session is cancelled are marked cancelled.
     */
    void run(std::vector<direct_task> tasks);

private:
    void worker_loop();
    void run_task(const direct_task& task);
    auto attempt(const direct_task& task, const cancellation_token& token)
        -> result<file_record>;

    std::shared_ptr<upload_backend> backend_;
    std::shared_ptr<adapters::upload_thread_pool_interface> worker_threads_;
    std::shared_ptr<progress_aggregator> aggregator_;
    std::shared_ptr<transfer_control> control_;
    orchestrator_config config_;
    retry_policy retry_;
    chunked_uploader chunked_;

    std::mutex queue_mutex_;
    std::deque<direct_task> queue_;
};

}  // namespace kcenon::upload_orchestrator

#endif  // KCENON_UPLOAD_ORCHESTRATOR_CLIENT_DIRECT_WORKER_POOL_H
