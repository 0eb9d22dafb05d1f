/**
 * @file upload_orchestrator.cpp
 * @brief Implementation of the upload orchestrator
 */

#include "kcenon/upload_orchestrator/client/upload_orchestrator.h"

#include "kcenon/upload_orchestrator/adapters/thread_pool_adapter.h"
#include "kcenon/upload_orchestrator/client/bulk_batch_coordinator.h"
#include "kcenon/upload_orchestrator/client/direct_worker_pool.h"
#include "kcenon/upload_orchestrator/core/logging.h"
#include "kcenon/upload_orchestrator/core/strategy_selector.h"
#include "kcenon/upload_orchestrator/core/task_id.h"
#include "kcenon/upload_orchestrator/core/transfer_control.h"

#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <vector>

namespace kcenon::upload_orchestrator {

struct upload_orchestrator::impl {
    orchestrator_config config;
    std::shared_ptr<upload_backend> backend;
    strategy_selector selector;
    std::shared_ptr<progress_aggregator> aggregator;

    std::shared_ptr<adapters::upload_thread_pool_interface> session_threads;
    std::shared_ptr<adapters::upload_thread_pool_interface> worker_threads;
    std::shared_ptr<adapters::upload_thread_pool_interface> chunk_threads;

    // Session lifecycle, guarded by session_mutex
    mutable std::mutex session_mutex;
    std::condition_variable session_cv;
    bool running = false;
    // Sessions whose runner has not returned from finish_session yet
    std::size_t unsettled = 0;
    std::shared_ptr<transfer_control> control;
    std::vector<std::future<void>> session_futures;

    impl(orchestrator_config cfg, std::shared_ptr<upload_backend> be)
        : config(std::move(cfg)),
          backend(std::move(be)),
          selector(config.strategy),
          aggregator(std::make_shared<progress_aggregator>()) {
        session_threads = adapters::upload_pool_factory::create(1, "upload_session");
        worker_threads = adapters::upload_pool_factory::create(
            config.workers.max_concurrent, "direct_workers");
        chunk_threads = adapters::upload_pool_factory::create(
            config.workers.max_concurrent * config.chunks.max_concurrent_chunks,
            "chunk_workers");
    }

    /**
     * @brief Control of the running session, or nullptr
     *
     * Aggregator calls are made without session_mutex held, since observers
     * run synchronously and may query the orchestrator.
     */
    auto active_control() const -> std::shared_ptr<transfer_control> {
        std::lock_guard<std::mutex> lock(session_mutex);
        return running ? control : nullptr;
    }

    /**
     * @brief Mirror the published session status onto the worker gate
     *
     * Snapshots reach observers in sequence order, so the gate always ends
     * up matching the newest status even when pause() and resume() race.
     */
    void follow_status(session_status status) {
        auto gate = active_control();
        if (!gate) {
            return;
        }
        if (status == session_status::paused) {
            gate->pause();
        } else if (status == session_status::uploading) {
            gate->resume();
        }
    }

    /**
     * @brief Join finished session tasks. Caller holds session_mutex.
     *
     * A runner may still be delivering its complete snapshot (an observer
     * can start the next session from there), so unless @p all is set only
     * futures that are already ready are joined.
     */
    void reap_locked(bool all = false) {
        auto it = session_futures.begin();
        while (it != session_futures.end()) {
            if (!all && it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }
            try {
                it->get();
            } catch (const std::exception& e) {
                UO_LOG_ERROR(log_category::orchestrator,
                             std::string("Session task failed: ") + e.what());
            }
            it = session_futures.erase(it);
        }
    }

    void run_session(transfer_plan plan,
                     std::vector<std::string> ids,
                     std::vector<file_ref> files,
                     std::shared_ptr<transfer_control> session_control) {
        try {
            if (plan.path == transfer_path::direct) {
                std::vector<direct_task> tasks;
                tasks.reserve(files.size());
                for (std::size_t i = 0; i < files.size(); ++i) {
                    tasks.push_back({ids[i], std::move(files[i]), plan.methods[i]});
                }
                direct_worker_pool pool(backend, worker_threads, chunk_threads, aggregator,
                                        session_control, config);
                pool.run(std::move(tasks));
            } else {
                std::vector<bulk_task> tasks;
                tasks.reserve(files.size());
                for (std::size_t i = 0; i < files.size(); ++i) {
                    tasks.push_back({ids[i], std::move(files[i])});
                }
                bulk_batch_coordinator coordinator(backend, aggregator, session_control,
                                                   config.bulk, config.category);
                coordinator.run(tasks);
            }
        } catch (const std::exception& e) {
            UO_LOG_ERROR(log_category::orchestrator,
                         std::string("Upload session aborted: ") + e.what());
        }

        finish_session();
    }

    void finish_session() {
        if (auto leftover = aggregator->cancel_remaining(); leftover > 0) {
            UO_LOG_WARN(log_category::orchestrator,
                        std::to_string(leftover) + " unfinished tasks cancelled at session end");
        }

        auto final_state = aggregator->snapshot();
        final_state.status = session_status::complete;

        // Observers of the complete snapshot may dismiss and start again
        {
            std::lock_guard<std::mutex> lock(session_mutex);
            running = false;
        }
        if (auto r = aggregator->set_session_status(session_status::complete); !r) {
            UO_LOG_ERROR(log_category::orchestrator,
                         "Could not complete session: " + r.error().message);
        }
        UO_LOG_INFO(log_category::orchestrator, "Session finished. " + final_state.summary());

        {
            std::lock_guard<std::mutex> lock(session_mutex);
            --unsettled;
        }
        session_cv.notify_all();
    }
};

// Builder implementation
upload_orchestrator::builder::builder() = default;

auto upload_orchestrator::builder::with_direct_threshold(std::size_t count) -> builder& {
    config_.strategy.direct_threshold = count;
    return *this;
}

auto upload_orchestrator::builder::with_concurrency(std::size_t workers) -> builder& {
    config_.workers.max_concurrent = workers;
    return *this;
}

auto upload_orchestrator::builder::with_chunk_threshold(uint64_t bytes) -> builder& {
    config_.strategy.chunk_threshold = bytes;
    return *this;
}

auto upload_orchestrator::builder::with_chunk_size(std::size_t bytes) -> builder& {
    config_.chunks.chunk_size = bytes;
    return *this;
}

auto upload_orchestrator::builder::with_chunk_concurrency(std::size_t chunks) -> builder& {
    config_.chunks.max_concurrent_chunks = chunks;
    return *this;
}

auto upload_orchestrator::builder::with_max_retries(uint32_t retries) -> builder& {
    config_.retry.max_retries = retries;
    return *this;
}

auto upload_orchestrator::builder::with_retry_base_delay(std::chrono::milliseconds delay)
    -> builder& {
    config_.retry.base_delay = delay;
    return *this;
}

auto upload_orchestrator::builder::with_bulk_batch_size(std::size_t files) -> builder& {
    config_.bulk.batch_size = files;
    return *this;
}

auto upload_orchestrator::builder::with_poll_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.bulk.poll_interval = interval;
    return *this;
}

auto upload_orchestrator::builder::with_category(std::string category) -> builder& {
    config_.category = std::move(category);
    return *this;
}

auto upload_orchestrator::builder::with_config(orchestrator_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto upload_orchestrator::builder::with_backend(std::shared_ptr<upload_backend> backend)
    -> builder& {
    backend_ = std::move(backend);
    return *this;
}

auto upload_orchestrator::builder::build() -> result<upload_orchestrator> {
    if (auto r = config_.validate(); !r) {
        return unexpected(r.error());
    }
    if (!backend_) {
        return unexpected(error{error_code::not_initialized, "an upload backend is required"});
    }
    return upload_orchestrator{std::move(config_), std::move(backend_)};
}

// upload_orchestrator implementation
upload_orchestrator::upload_orchestrator(orchestrator_config config,
                                         std::shared_ptr<upload_backend> backend)
    : impl_(std::make_unique<impl>(std::move(config), std::move(backend))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto* self = impl_.get();
    impl_->aggregator->subscribe(
        [self](const transfer_session& s) { self->follow_status(s.status); });
}

upload_orchestrator::upload_orchestrator(upload_orchestrator&&) noexcept = default;
auto upload_orchestrator::operator=(upload_orchestrator&&) noexcept
    -> upload_orchestrator& = default;

upload_orchestrator::~upload_orchestrator() {
    if (!impl_) {
        return;
    }
    if (is_running()) {
        (void)cancel();
    }
    wait();
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    impl_->reap_locked(true);
}

auto upload_orchestrator::start_upload(std::vector<file_ref> files) -> result<void> {
    if (files.empty()) {
        return unexpected(error{error_code::validation_failed, "no files to upload"});
    }
    for (const auto& file : files) {
        if (file.name.empty()) {
            return unexpected(error{error_code::validation_failed, "file without a name"});
        }
        if (!file.source) {
            return unexpected(error{error_code::validation_failed,
                                    "file has no data source: " + file.name});
        }
    }

    {
        std::lock_guard<std::mutex> lock(impl_->session_mutex);
        if (impl_->running) {
            return unexpected(error{error_code::session_active, "an upload is already running"});
        }
        impl_->reap_locked();
    }

    auto plan = impl_->selector.plan(files);

    std::vector<file_task> tasks;
    std::vector<std::string> ids;
    tasks.reserve(files.size());
    ids.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        file_task task;
        task.id = task_id::generate().to_string();
        task.name = files[i].name;
        task.size = files[i].size;
        task.content_type = files[i].effective_content_type();
        if (plan.path == transfer_path::direct) {
            task.method = plan.methods[i];
        }
        ids.push_back(task.id);
        tasks.push_back(std::move(task));
    }

    if (auto r = impl_->aggregator->begin_session(std::move(tasks), plan.path); !r) {
        return r;
    }

    UO_LOG_INFO(log_category::orchestrator,
                "Upload started: " + std::to_string(files.size()) + " files via " +
                    to_string(plan.path) + " path (" + std::to_string(plan.chunked_count()) +
                    " chunked)");

    auto control = std::make_shared<transfer_control>();
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    impl_->control = control;
    impl_->running = true;
    ++impl_->unsettled;

    auto* self = impl_.get();
    impl_->session_futures.push_back(impl_->session_threads->submit_to_stage(
        [self, plan = std::move(plan), ids = std::move(ids), files = std::move(files),
         control]() mutable {
            self->run_session(std::move(plan), std::move(ids), std::move(files), control);
        },
        "session"));
    return {};
}

auto upload_orchestrator::pause() -> result<void> {
    auto control = impl_->active_control();
    if (!control) {
        return unexpected(error{error_code::no_active_session, "no upload is running"});
    }

    if (impl_->aggregator->snapshot().path == transfer_path::bulk) {
        return unexpected(error{error_code::operation_not_supported,
                                "bulk jobs cannot be paused"});
    }

    if (auto r = impl_->aggregator->set_session_status(session_status::paused); !r) {
        return r;
    }
    UO_LOG_INFO(log_category::orchestrator, "Upload paused");
    return {};
}

auto upload_orchestrator::resume() -> result<void> {
    auto control = impl_->active_control();
    if (!control) {
        return unexpected(error{error_code::no_active_session, "no upload is running"});
    }

    if (auto r = impl_->aggregator->set_session_status(session_status::uploading); !r) {
        return r;
    }
    UO_LOG_INFO(log_category::orchestrator, "Upload resumed");
    return {};
}

auto upload_orchestrator::cancel() -> result<void> {
    auto control = impl_->active_control();
    if (!control) {
        return unexpected(error{error_code::no_active_session, "no upload is running"});
    }

    if (auto r = impl_->aggregator->set_session_status(session_status::cancelling); !r) {
        // The session completed on its own in the meantime
        return unexpected(error{error_code::no_active_session, r.error().message});
    }
    control->cancel();
    UO_LOG_INFO(log_category::orchestrator, "Upload cancellation requested");
    return {};
}

auto upload_orchestrator::dismiss() -> result<void> {
    // The aggregator rejects the reset while tasks are still in flight
    if (auto r = impl_->aggregator->reset(); !r) {
        return r;
    }
    UO_LOG_DEBUG(log_category::orchestrator, "Session dismissed");
    return {};
}

auto upload_orchestrator::snapshot() const -> transfer_session {
    return impl_->aggregator->snapshot();
}

auto upload_orchestrator::subscribe(observer callback) -> subscription_id {
    return impl_->aggregator->subscribe(std::move(callback));
}

void upload_orchestrator::unsubscribe(subscription_id id) {
    impl_->aggregator->unsubscribe(id);
}

auto upload_orchestrator::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->running;
}

auto upload_orchestrator::wait() -> transfer_session {
    std::unique_lock<std::mutex> lock(impl_->session_mutex);
    impl_->session_cv.wait(lock, [this] { return !impl_->running && impl_->unsettled == 0; });
    return impl_->aggregator->snapshot();
}

auto upload_orchestrator::wait_for(std::chrono::milliseconds timeout)
    -> result<transfer_session> {
    std::unique_lock<std::mutex> lock(impl_->session_mutex);
    if (!impl_->session_cv.wait_for(
            lock, timeout, [this] { return !impl_->running && impl_->unsettled == 0; })) {
        return unexpected(error{error_code::request_timeout,
                                "upload did not finish within the timeout"});
    }
    return impl_->aggregator->snapshot();
}

auto upload_orchestrator::config() const -> const orchestrator_config& {
    return impl_->config;
}

}  // namespace kcenon::upload_orchestrator
