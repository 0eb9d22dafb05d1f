/**
 * @file bulk_batch_coordinator.cpp
 * @brief Implementation of the bulk job path
 */

#include "kcenon/upload_orchestrator/client/bulk_batch_coordinator.h"

#include "kcenon/upload_orchestrator/core/logging.h"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::upload_orchestrator {

namespace {

void log_rejected(const result<void>& r, std::string_view action) {
    if (!r) {
        UO_LOG_WARN(log_category::bulk,
                    std::string(action) + " rejected: " + r.error().message);
    }
}

auto remainder_status(const std::optional<job_status>& status) -> task_status {
    if (!status || !status->is_terminal()) {
        return task_status::cancelled;
    }
    switch (status->status) {
        case job_state::completed:
        case job_state::completed_with_errors:
            return task_status::completed;
        case job_state::failed:
            return task_status::failed;
        default:
            return task_status::cancelled;
    }
}

auto base_name(std::string_view path) -> std::string_view {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

bulk_batch_coordinator::bulk_batch_coordinator(std::shared_ptr<upload_backend> backend,
                                               std::shared_ptr<progress_aggregator> aggregator,
                                               std::shared_ptr<transfer_control> control,
                                               bulk_config config,
                                               std::string category)
    : backend_(std::move(backend)),
      aggregator_(std::move(aggregator)),
      control_(std::move(control)),
      config_(config),
      category_(std::move(category)) {}

auto bulk_batch_coordinator::make_batches(std::size_t count, std::size_t batch_size)
    -> std::vector<batch_range> {
    std::vector<batch_range> batches;
    if (count == 0 || batch_size == 0) {
        return batches;
    }
    batches.reserve((count + batch_size - 1) / batch_size);
    for (std::size_t begin = 0; begin < count; begin += batch_size) {
        batches.push_back({begin, std::min(begin + batch_size, count)});
    }
    return batches;
}

auto bulk_batch_coordinator::reconcile(const std::vector<bulk_task>& batch,
                                       const std::optional<job_status>& status)
    -> std::vector<bulk_task_outcome> {
    std::unordered_set<std::string> names;
    for (const auto& task : batch) {
        names.insert(task.file.name);
    }

    // One error entry accounts for one file
    std::unordered_map<std::string, std::deque<std::string>> failures;
    std::deque<std::string> unmatched;
    std::size_t successes = 0;
    std::size_t reported_errors = 0;
    if (status) {
        for (const auto& entry : status->failed_files()) {
            auto message = entry.message.empty() ? std::string("upload failed") : entry.message;
            auto key = entry.filename;
            if (names.count(key) == 0) {
                key = std::string(base_name(key));
            }
            if (names.count(key) != 0) {
                failures[key].push_back(std::move(message));
            } else {
                unmatched.push_back(std::move(message));
            }
        }
        successes = status->success_count;
        reported_errors = status->error_count;
    }

    std::vector<bulk_task_outcome> outcomes(batch.size());
    std::vector<bool> settled(batch.size(), false);
    std::size_t named_failures = 0;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        outcomes[i].task_id = batch[i].task_id;
        auto it = failures.find(batch[i].file.name);
        if (it != failures.end() && !it->second.empty()) {
            outcomes[i].status = task_status::failed;
            outcomes[i].error = std::move(it->second.front());
            it->second.pop_front();
            settled[i] = true;
            ++named_failures;
        }
    }

    auto unnamed_failures = reported_errors > named_failures ? reported_errors - named_failures : 0;
    const auto rest = remainder_status(status);
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (settled[i]) {
            continue;
        }
        auto& outcome = outcomes[i];
        if (successes > 0) {
            outcome.status = task_status::completed;
            --successes;
        } else if (unnamed_failures > 0) {
            outcome.status = task_status::failed;
            if (unmatched.empty()) {
                outcome.error = "upload failed";
            } else {
                outcome.error = std::move(unmatched.front());
                unmatched.pop_front();
            }
            --unnamed_failures;
        } else {
            outcome.status = rest;
            if (rest == task_status::failed) {
                outcome.error = "bulk job failed";
            }
        }
    }
    return outcomes;
}

void bulk_batch_coordinator::run(const std::vector<bulk_task>& tasks) {
    auto batches = make_batches(tasks.size(), config_.batch_size);
    UO_LOG_INFO(log_category::bulk,
                std::to_string(tasks.size()) + " files split into " +
                    std::to_string(batches.size()) + " bulk batches");

    auto token = control_->token();
    for (std::size_t i = 0; i < batches.size(); ++i) {
        std::vector<bulk_task> batch(tasks.begin() + static_cast<std::ptrdiff_t>(batches[i].begin),
                                     tasks.begin() + static_cast<std::ptrdiff_t>(batches[i].end));

        if (token.is_cancellation_requested()) {
            mark_batch(batch, task_status::cancelled, {});
            continue;
        }
        run_batch(batch, i);
    }
}

void bulk_batch_coordinator::run_batch(const std::vector<bulk_task>& batch,
                                       std::size_t batch_index) {
    auto token = control_->token();

    std::vector<file_ref> files;
    std::vector<std::string> ids;
    files.reserve(batch.size());
    ids.reserve(batch.size());
    for (const auto& task : batch) {
        log_rejected(aggregator_->mark_started(task.task_id), "start");
        files.push_back(task.file);
        ids.push_back(task.task_id);
    }

    upload_log_context ctx;
    ctx.batch_index = batch_index;

    auto job_id = backend_->start_bulk_job(files, category_);
    if (!job_id) {
        ctx.error_message = job_id.error().message;
        if (is_cancellation(job_id.error().code) || token.is_cancellation_requested()) {
            UO_LOG_INFO_CTX(log_category::bulk, "Bulk batch cancelled before submission", ctx);
            mark_batch(batch, task_status::cancelled, {});
        } else {
            UO_LOG_ERROR_CTX(log_category::bulk, "Bulk job submission failed", ctx);
            mark_batch(batch, task_status::failed, job_id.error().message);
        }
        return;
    }

    ctx.job_id = job_id.value();
    UO_LOG_INFO_CTX(log_category::bulk,
                    "Bulk job submitted with " + std::to_string(batch.size()) + " files", ctx);

    if (auto r = aggregator_->begin_bulk_batch(ids, job_id.value()); !r) {
        ctx.error_message = r.error().message;
        UO_LOG_ERROR_CTX(log_category::bulk, "Bulk batch could not be tracked", ctx);
        std::optional<job_status> ignored;
        cancel_job(job_id.value(), ignored);
        mark_batch(batch, task_status::failed, r.error().message);
        return;
    }

    auto last = poll_until_terminal(job_id.value());
    if (!last || !last->is_terminal()) {
        cancel_job(job_id.value(), last);
    }

    if (last) {
        ctx.error_message.reset();
        UO_LOG_INFO_CTX(log_category::bulk,
                        std::string("Bulk job finished as ") + to_string(last->status) + ": " +
                            std::to_string(last->success_count) + " succeeded, " +
                            std::to_string(last->error_count) + " failed",
                        ctx);
    }

    log_rejected(aggregator_->reconcile_bulk_batch(reconcile(batch, last)), "reconcile");
}

auto bulk_batch_coordinator::poll_until_terminal(const std::string& job_id)
    -> std::optional<job_status> {
    auto token = control_->token();
    std::optional<job_status> last;

    // First poll goes out immediately
    bool first = true;
    while (true) {
        if (!first && token.wait_for(config_.poll_interval)) {
            return last;
        }
        first = false;
        if (token.is_cancellation_requested()) {
            return last;
        }

        auto status = poll_once(job_id);
        if (!status) {
            continue;
        }

        last = std::move(status);
        log_rejected(aggregator_->apply_bulk_progress(last->success_count, last->error_count,
                                                      last->current_file.value_or("")),
                     "progress");
        if (last->is_terminal()) {
            return last;
        }
    }
}

auto bulk_batch_coordinator::poll_once(const std::string& job_id) -> std::optional<job_status> {
    auto status = backend_->poll_bulk_job(job_id);
    if (!status) {
        upload_log_context ctx;
        ctx.job_id = job_id;
        ctx.error_message = status.error().message;
        UO_LOG_WARN_CTX(log_category::bulk, "Bulk job poll failed; polling again", ctx);
        return std::nullopt;
    }
    return std::move(status).value();
}

void bulk_batch_coordinator::cancel_job(const std::string& job_id,
                                        std::optional<job_status>& last) {
    upload_log_context ctx;
    ctx.job_id = job_id;

    if (auto r = backend_->cancel_bulk_job(job_id); !r) {
        ctx.error_message = r.error().message;
        UO_LOG_WARN_CTX(log_category::bulk, "Server-side job cancellation failed", ctx);
    } else {
        UO_LOG_INFO_CTX(log_category::bulk, "Server-side job cancellation requested", ctx);
    }

    // Files the server finished before the cancel still count
    if (auto status = poll_once(job_id)) {
        last = std::move(status);
    }
}

void bulk_batch_coordinator::mark_batch(const std::vector<bulk_task>& batch,
                                        task_status status,
                                        const std::string& message) {
    for (const auto& task : batch) {
        if (status == task_status::failed) {
            log_rejected(aggregator_->mark_failed(task.task_id, message), "fail");
        } else {
            log_rejected(aggregator_->mark_cancelled(task.task_id), "cancel");
        }
    }
}

}  // namespace kcenon::upload_orchestrator
