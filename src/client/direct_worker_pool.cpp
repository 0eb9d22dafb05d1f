/**
 * @file direct_worker_pool.cpp
 * @brief Implementation of the direct-path worker pool
 */

#include "kcenon/upload_orchestrator/client/direct_worker_pool.h"

#include "kcenon/upload_orchestrator/core/logging.h"

#include <algorithm>
#include <exception>
#include <future>
#include <optional>

namespace kcenon::upload_orchestrator {

namespace {

void log_rejected(const result<void>& r, std::string_view action, const std::string& task_id) {
    if (!r) {
        UO_LOG_WARN(log_category::worker_pool,
                    std::string(action) + " rejected for task " + task_id + ": " +
                        r.error().message);
    }
}

}  // namespace

direct_worker_pool::direct_worker_pool(
    std::shared_ptr<upload_backend> backend,
    std::shared_ptr<adapters::upload_thread_pool_interface> worker_threads,
    std::shared_ptr<adapters::upload_thread_pool_interface> chunk_threads,
    std::shared_ptr<progress_aggregator> aggregator,
    std::shared_ptr<transfer_control> control,
    orchestrator_config config)
    : backend_(backend),
      worker_threads_(std::move(worker_threads)),
      aggregator_(std::move(aggregator)),
      control_(std::move(control)),
      config_(std::move(config)),
      retry_(config_.retry),
      chunked_(std::move(backend), std::move(chunk_threads), config_.chunks) {}

void direct_worker_pool::run(std::vector<direct_task> tasks) {
    if (tasks.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.assign(std::make_move_iterator(tasks.begin()),
                      std::make_move_iterator(tasks.end()));
    }

    auto worker_count = std::min(config_.workers.max_concurrent, tasks.size());
    UO_LOG_INFO(log_category::worker_pool,
                "Starting " + std::to_string(worker_count) + " workers for " +
                    std::to_string(tasks.size()) + " files");

    std::vector<std::future<void>> futures;
    futures.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        futures.push_back(
            worker_threads_->submit_to_stage([this] { worker_loop(); }, "direct_worker"));
    }

    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            UO_LOG_ERROR(log_category::worker_pool,
                         std::string("Worker terminated unexpectedly: ") + e.what());
        }
    }

    // Whatever was never pulled is cancelled
    std::deque<direct_task> leftover;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        leftover.swap(queue_);
    }
    for (const auto& task : leftover) {
        log_rejected(aggregator_->mark_cancelled(task.task_id), "cancel", task.task_id);
    }
    if (!leftover.empty()) {
        UO_LOG_INFO(log_category::worker_pool,
                    std::to_string(leftover.size()) + " queued files cancelled");
    }
}

void direct_worker_pool::worker_loop() {
    while (true) {
        if (!control_->wait_until_runnable()) {
            return;
        }

        std::optional<direct_task> next;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) {
                return;
            }
            next = std::move(queue_.front());
            queue_.pop_front();
        }

        run_task(*next);
    }
}

auto direct_worker_pool::attempt(const direct_task& task, const cancellation_token& token)
    -> result<file_record> {
    if (task.method == upload_method::chunked) {
        return chunked_.upload(task.file, config_.category, token, [&](uint64_t bytes) {
            log_rejected(aggregator_->update_bytes(task.task_id, bytes), "progress",
                         task.task_id);
        });
    }
    return backend_->upload_single(task.file, config_.category, token);
}

void direct_worker_pool::run_task(const direct_task& task) {
    auto token = control_->token();

    log_rejected(aggregator_->set_method(task.task_id, task.method), "method", task.task_id);
    log_rejected(aggregator_->mark_started(task.task_id), "start", task.task_id);

    upload_log_context ctx;
    ctx.task_id = task.task_id;
    ctx.filename = task.file.name;
    ctx.file_size = task.file.size;
    UO_LOG_DEBUG_CTX(log_category::worker_pool,
                     std::string("Uploading (") + to_string(task.method) + ")", ctx);

    auto outcome = retry_.execute(
        [&](uint32_t) { return attempt(task, token); },
        token,
        [&](uint32_t next_attempt, const error& cause) {
            log_rejected(aggregator_->record_retry(task.task_id, next_attempt, cause.message),
                         "retry", task.task_id);
        });

    if (outcome && !token.is_cancellation_requested()) {
        log_rejected(aggregator_->mark_completed(task.task_id), "complete", task.task_id);
        UO_LOG_DEBUG_CTX(log_category::worker_pool, "Upload completed", ctx);
        return;
    }

    // A success that lands after cancellation is discarded
    if (outcome || is_cancellation(outcome.error().code)) {
        log_rejected(aggregator_->mark_cancelled(task.task_id), "cancel", task.task_id);
        UO_LOG_DEBUG_CTX(log_category::worker_pool, "Upload cancelled", ctx);
        return;
    }

    ctx.error_message = outcome.error().message;
    log_rejected(aggregator_->mark_failed(task.task_id, outcome.error().message), "fail",
                 task.task_id);
    UO_LOG_WARN_CTX(log_category::worker_pool, "Upload failed", ctx);
}

}  // namespace kcenon::upload_orchestrator
