/**
 * @file progress_aggregator.cpp
 * @brief Implementation of the session state aggregate
 */

#include "kcenon/upload_orchestrator/core/progress_aggregator.h"

#include "kcenon/upload_orchestrator/core/logging.h"

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace kcenon::upload_orchestrator {

namespace {

auto unknown_task(std::string_view task_id) -> error {
    return error{error_code::validation_failed, "unknown task id: " + std::string(task_id)};
}

auto terminal_task(const file_task& task) -> error {
    return error{error_code::invalid_state_transition,
                 "task " + task.id + " is already " + to_string(task.status)};
}

auto is_active(session_status s) -> bool {
    return s == session_status::uploading || s == session_status::paused ||
           s == session_status::cancelling;
}

auto transition_allowed(session_status from, session_status to) -> bool {
    switch (from) {
        case session_status::uploading:
            return to == session_status::paused || to == session_status::cancelling ||
                   to == session_status::complete;
        case session_status::paused:
            return to == session_status::uploading || to == session_status::cancelling ||
                   to == session_status::complete;
        case session_status::cancelling:
            return to == session_status::complete;
        case session_status::idle:
        case session_status::complete:
        default:
            return false;
    }
}

}  // namespace

/**
 * @brief Implementation details for progress_aggregator
 */
struct progress_aggregator::impl {
    struct bulk_batch_state {
        bool active = false;
        std::unordered_set<std::string> task_ids;
        std::size_t provisional_completed = 0;
        std::size_t provisional_failed = 0;
    };

    // Session state, guarded by state_mutex
    mutable std::mutex state_mutex;
    std::vector<file_task> tasks;
    std::unordered_map<std::string, std::size_t> index;
    session_status status = session_status::idle;
    transfer_path path = transfer_path::none;
    std::string current_file;
    std::optional<std::string> bulk_job_id;
    uint64_t total_bytes = 0;
    bulk_batch_state batch;
    uint64_t sequence = 0;
    transfer_session current;

    // Observers
    std::mutex observers_mutex;
    std::map<subscription_id, observer> observers;
    subscription_id next_subscription = 1;

    // Delivery ordering; recursive so observers can mutate the session
    std::recursive_mutex notify_mutex;
    uint64_t last_delivered = 0;

    auto find(std::string_view task_id) -> file_task* {
        auto it = index.find(std::string(task_id));
        return it != index.end() ? &tasks[it->second] : nullptr;
    }

    /**
     * @brief Build and cache the next snapshot. Caller holds state_mutex.
     */
    auto publish_locked() -> transfer_session {
        transfer_session next;
        next.sequence = ++sequence;
        next.total = tasks.size();
        next.total_bytes = total_bytes;
        next.status = status;
        next.path = path;
        next.current_file_name = current_file;
        next.bulk_job_id = bulk_job_id;
        next.files = tasks;

        uint64_t task_bytes = 0;
        for (const auto& t : tasks) {
            switch (t.status) {
                case task_status::completed: ++next.completed; break;
                case task_status::failed: ++next.failed; break;
                case task_status::cancelled: ++next.cancelled; break;
                default: break;
            }
            task_bytes += t.bytes_uploaded;
        }

        if (batch.active) {
            next.completed += batch.provisional_completed;
            next.failed += batch.provisional_failed;
        }

        if (path == transfer_path::bulk) {
            // Server jobs report counts, not bytes: estimate from files processed
            uint64_t estimate = 0;
            if (next.total > 0 && total_bytes > 0) {
                auto processed = static_cast<double>(next.completed + next.failed);
                estimate = static_cast<uint64_t>(
                    processed / static_cast<double>(next.total) *
                        static_cast<double>(total_bytes) + 0.5);
            }
            next.uploaded_bytes = std::max({current.uploaded_bytes, task_bytes, estimate});
        } else {
            next.uploaded_bytes = task_bytes;
        }
        next.uploaded_bytes = std::min(next.uploaded_bytes, total_bytes);

        current = next;
        return next;
    }

    /**
     * @brief Apply final outcomes of the active bulk batch. Caller holds state_mutex.
     *
     * Published counts already include the batch's provisional server
     * counters, so outcomes are shifted until completed and failed each reach
     * at least those values. Cancelled outcomes give way first, then the
     * surplus of the other final state, starting from the end of the batch.
     *
     * @return Number of tasks that changed
     */
    auto settle_batch_locked(const std::vector<bulk_task_outcome>& outcomes) -> std::size_t {
        std::vector<std::pair<file_task*, bulk_task_outcome>> open;
        open.reserve(outcomes.size());
        for (const auto& outcome : outcomes) {
            auto* task = find(outcome.task_id);
            if (task && !task->is_terminal()) {
                open.emplace_back(task, outcome);
            }
        }

        auto count_of = [&open](task_status s) {
            return static_cast<std::size_t>(std::count_if(
                open.begin(), open.end(),
                [s](const auto& entry) { return entry.second.status == s; }));
        };

        std::size_t shifted = 0;
        auto lift = [&](task_status target, std::size_t floor,
                        task_status other, std::size_t other_floor) {
            auto have = count_of(target);
            auto other_have = count_of(other);
            for (auto donor : {task_status::cancelled, other}) {
                for (auto it = open.rbegin(); it != open.rend() && have < floor; ++it) {
                    auto& outcome = it->second;
                    if (outcome.status != donor) {
                        continue;
                    }
                    if (donor == other) {
                        if (other_have <= other_floor) {
                            break;
                        }
                        --other_have;
                    }
                    outcome.status = target;
                    outcome.error.reset();
                    if (target == task_status::failed) {
                        outcome.error = "upload failed";
                    }
                    ++have;
                    ++shifted;
                }
            }
        };
        lift(task_status::completed, batch.provisional_completed,
             task_status::failed, batch.provisional_failed);
        lift(task_status::failed, batch.provisional_failed,
             task_status::completed, batch.provisional_completed);

        if (shifted > 0) {
            UO_LOG_WARN(log_category::aggregator,
                        std::to_string(shifted) +
                            " bulk outcomes adjusted to match counts the server already reported");
        }

        for (auto& [task, outcome] : open) {
            task->status = outcome.status;
            task->error = outcome.error;
            if (outcome.status == task_status::completed) {
                task->bytes_uploaded = task->size;
            }
        }
        batch = {};
        return open.size();
    }

    void deliver(const transfer_session& snap) {
        std::lock_guard<std::recursive_mutex> lock(notify_mutex);
        if (snap.sequence <= last_delivered) {
            return;
        }
        last_delivered = snap.sequence;

        std::vector<observer> targets;
        {
            std::lock_guard<std::mutex> obs_lock(observers_mutex);
            targets.reserve(observers.size());
            for (const auto& [id, cb] : observers) {
                targets.push_back(cb);
            }
        }

        for (const auto& cb : targets) {
            // A nested mutation from an observer already delivered a newer one
            if (last_delivered != snap.sequence) {
                break;
            }
            try {
                cb(snap);
            } catch (const std::exception& e) {
                UO_LOG_WARN(log_category::aggregator,
                            std::string("Snapshot observer threw: ") + e.what());
            }
        }
    }

    template <typename Mutation>
    auto update_task(std::string_view task_id, Mutation&& mutate) -> result<void> {
        transfer_session snap;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (!is_active(status)) {
                return unexpected(error{error_code::no_active_session,
                                        "no active session for task update"});
            }
            auto* task = find(task_id);
            if (!task) {
                return unexpected(unknown_task(task_id));
            }
            if (task->is_terminal()) {
                return unexpected(terminal_task(*task));
            }
            if (auto r = mutate(*task); !r) {
                return r;
            }
            snap = publish_locked();
        }
        deliver(snap);
        return {};
    }
};

progress_aggregator::progress_aggregator() : impl_(std::make_unique<impl>()) {}

progress_aggregator::~progress_aggregator() = default;

auto progress_aggregator::begin_session(std::vector<file_task> tasks, transfer_path path)
    -> result<void> {
    if (tasks.empty()) {
        return unexpected(error{error_code::validation_failed, "no files to upload"});
    }
    if (path == transfer_path::none) {
        return unexpected(error{error_code::validation_failed, "transfer path not chosen"});
    }

    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->status != session_status::idle) {
            return unexpected(error{error_code::session_active,
                                    "session already exists; dismiss it first"});
        }

        std::unordered_map<std::string, std::size_t> index;
        uint64_t total_bytes = 0;
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            if (tasks[i].status != task_status::pending) {
                return unexpected(error{error_code::validation_failed,
                                        "task " + tasks[i].id + " is not pending"});
            }
            if (!index.emplace(tasks[i].id, i).second) {
                return unexpected(error{error_code::validation_failed,
                                        "duplicate task id: " + tasks[i].id});
            }
            total_bytes += tasks[i].size;
        }

        impl_->tasks = std::move(tasks);
        impl_->index = std::move(index);
        impl_->total_bytes = total_bytes;
        impl_->path = path;
        impl_->status = session_status::uploading;
        impl_->current_file.clear();
        impl_->bulk_job_id.reset();
        impl_->batch = {};
        snap = impl_->publish_locked();
    }

    UO_LOG_DEBUG(log_category::aggregator,
                 "Session started: " + std::to_string(snap.total) + " files, " +
                     format_bytes(snap.total_bytes) + ", " + to_string(path) + " path");
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::set_session_status(session_status status) -> result<void> {
    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->status == status) {
            return {};
        }
        if (!transition_allowed(impl_->status, status)) {
            return unexpected(error{error_code::invalid_state_transition,
                                    std::string("cannot move session from ") +
                                        to_string(impl_->status) + " to " + to_string(status)});
        }
        if (status == session_status::complete) {
            bool unfinished = impl_->batch.active ||
                              std::any_of(impl_->tasks.begin(), impl_->tasks.end(),
                                          [](const file_task& t) { return !t.is_terminal(); });
            if (unfinished) {
                return unexpected(error{error_code::invalid_state_transition,
                                        "session has unfinished tasks"});
            }
            impl_->current_file.clear();
        }
        impl_->status = status;
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::reset() -> result<void> {
    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (is_active(impl_->status)) {
            return unexpected(error{error_code::session_active,
                                    "cannot reset while the session is active"});
        }
        if (impl_->status == session_status::idle) {
            return {};
        }
        impl_->tasks.clear();
        impl_->index.clear();
        impl_->status = session_status::idle;
        impl_->path = transfer_path::none;
        impl_->current_file.clear();
        impl_->bulk_job_id.reset();
        impl_->total_bytes = 0;
        impl_->batch = {};
        impl_->current = transfer_session{};
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::mark_started(std::string_view task_id) -> result<void> {
    return impl_->update_task(task_id, [this](file_task& t) -> result<void> {
        t.status = task_status::uploading;
        t.attempts = std::max<uint32_t>(t.attempts, 1);
        impl_->current_file = t.name;
        return {};
    });
}

auto progress_aggregator::record_retry(std::string_view task_id,
                                       uint32_t attempt,
                                       std::string_view reason) -> result<void> {
    return impl_->update_task(task_id, [&](file_task& t) -> result<void> {
        if (t.status != task_status::uploading) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "task " + t.id + " is not uploading"});
        }
        t.attempts = std::max(t.attempts, attempt);
        t.bytes_uploaded = 0;

        upload_log_context ctx;
        ctx.task_id = t.id;
        ctx.filename = t.name;
        ctx.attempt = attempt;
        ctx.error_message = std::string(reason);
        UO_LOG_INFO_CTX(log_category::retry, "Retrying upload", ctx);
        return {};
    });
}

auto progress_aggregator::update_bytes(std::string_view task_id, uint64_t bytes_uploaded)
    -> result<void> {
    return impl_->update_task(task_id, [&](file_task& t) -> result<void> {
        if (t.status != task_status::uploading) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "task " + t.id + " is not uploading"});
        }
        t.bytes_uploaded = std::max(t.bytes_uploaded, std::min(bytes_uploaded, t.size));
        return {};
    });
}

auto progress_aggregator::set_method(std::string_view task_id, upload_method method)
    -> result<void> {
    return impl_->update_task(task_id, [&](file_task& t) -> result<void> {
        t.method = method;
        return {};
    });
}

auto progress_aggregator::mark_completed(std::string_view task_id) -> result<void> {
    return impl_->update_task(task_id, [](file_task& t) -> result<void> {
        if (t.status != task_status::uploading) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "task " + t.id + " was never started"});
        }
        t.status = task_status::completed;
        t.bytes_uploaded = t.size;
        t.error.reset();
        return {};
    });
}

auto progress_aggregator::mark_failed(std::string_view task_id, std::string error_message)
    -> result<void> {
    return impl_->update_task(task_id, [&](file_task& t) -> result<void> {
        t.status = task_status::failed;
        t.error = std::move(error_message);
        return {};
    });
}

auto progress_aggregator::mark_cancelled(std::string_view task_id) -> result<void> {
    return impl_->update_task(task_id, [](file_task& t) -> result<void> {
        t.status = task_status::cancelled;
        return {};
    });
}

auto progress_aggregator::cancel_remaining() -> std::size_t {
    transfer_session snap;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!is_active(impl_->status)) {
            return 0;
        }
        if (impl_->batch.active) {
            std::vector<bulk_task_outcome> outcomes;
            for (const auto& id : impl_->batch.task_ids) {
                outcomes.push_back({id, task_status::cancelled, std::nullopt});
            }
            count += impl_->settle_batch_locked(outcomes);
        }
        for (auto& t : impl_->tasks) {
            if (!t.is_terminal()) {
                t.status = task_status::cancelled;
                ++count;
            }
        }
        if (count == 0) {
            return 0;
        }
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return count;
}

auto progress_aggregator::begin_bulk_batch(std::vector<std::string> task_ids,
                                           std::string job_id) -> result<void> {
    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!is_active(impl_->status)) {
            return unexpected(error{error_code::no_active_session, "no active session"});
        }
        if (impl_->path != transfer_path::bulk) {
            return unexpected(error{error_code::operation_not_supported,
                                    "session does not use the bulk path"});
        }
        if (impl_->batch.active) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "previous bulk batch not reconciled"});
        }

        if (task_ids.empty()) {
            return unexpected(error{error_code::validation_failed, "empty bulk batch"});
        }

        impl_->batch = {};
        impl_->batch.active = true;
        impl_->batch.task_ids.insert(task_ids.begin(), task_ids.end());
        for (const auto& id : task_ids) {
            auto* task = impl_->find(id);
            if (!task) {
                impl_->batch = {};
                return unexpected(unknown_task(id));
            }
            if (task->is_terminal()) {
                impl_->batch = {};
                return unexpected(terminal_task(*task));
            }
        }
        impl_->bulk_job_id = std::move(job_id);
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::apply_bulk_progress(std::size_t success_count,
                                              std::size_t error_count,
                                              std::string_view current_file)
    -> result<void> {
    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        auto& batch = impl_->batch;
        if (!batch.active) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "no bulk batch in progress"});
        }

        auto size = batch.task_ids.size();
        batch.provisional_completed =
            std::max(batch.provisional_completed, std::min(success_count, size));
        batch.provisional_failed = std::max(
            batch.provisional_failed,
            std::min(error_count, size - batch.provisional_completed));
        if (batch.provisional_completed + batch.provisional_failed > size) {
            batch.provisional_failed = size - batch.provisional_completed;
        }

        if (!current_file.empty()) {
            impl_->current_file = std::string(current_file);
        }
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::reconcile_bulk_batch(const std::vector<bulk_task_outcome>& outcomes)
    -> result<void> {
    transfer_session snap;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        auto& batch = impl_->batch;
        if (!batch.active) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "no bulk batch in progress"});
        }

        std::unordered_set<std::string> covered;
        for (const auto& outcome : outcomes) {
            if (batch.task_ids.count(outcome.task_id) == 0) {
                return unexpected(error{error_code::validation_failed,
                                        "task " + outcome.task_id + " is not in the batch"});
            }
            if (!is_terminal(outcome.status)) {
                return unexpected(error{error_code::invalid_state_transition,
                                        "outcome for " + outcome.task_id + " is not final"});
            }
            covered.insert(outcome.task_id);
        }
        if (covered.size() != batch.task_ids.size()) {
            return unexpected(error{error_code::invalid_state_transition,
                                    "outcomes do not cover the whole batch"});
        }

        impl_->settle_batch_locked(outcomes);
        snap = impl_->publish_locked();
    }
    impl_->deliver(snap);
    return {};
}

auto progress_aggregator::snapshot() const -> transfer_session {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->current;
}

auto progress_aggregator::subscribe(observer callback) -> subscription_id {
    std::lock_guard<std::mutex> lock(impl_->observers_mutex);
    auto id = impl_->next_subscription++;
    impl_->observers.emplace(id, std::move(callback));
    return id;
}

void progress_aggregator::unsubscribe(subscription_id id) {
    std::lock_guard<std::mutex> lock(impl_->observers_mutex);
    impl_->observers.erase(id);
}

}  // namespace kcenon::upload_orchestrator
