// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for upload_orchestrator
 */

#include "kcenon/upload_orchestrator/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::upload_orchestrator::adapters {

// ============================================================================
// thread_system_upload_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

}  // namespace

thread_system_upload_adapter::thread_system_upload_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool)
    : pool_(std::move(pool)) {}

std::shared_ptr<thread_system_upload_adapter>
thread_system_upload_adapter::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    if (worker_count == 0) {
        auto hardware = std::thread::hardware_concurrency();
        worker_count = hardware > 0 ? hardware : 4;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_upload_adapter>(std::move(pool));
}

std::future<void> thread_system_upload_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
        } catch (...) {
            promise->set_exception(std::current_exception());
            return;
        }
        promise->set_value();
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), stage_name);
    pool_->enqueue(std::move(job));

    return future;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_upload_pool implementation
// ============================================================================

std::future<void> async_upload_pool::submit_to_stage(
    std::function<void()> task, const std::string& /*stage_name*/) {
    return std::async(std::launch::async, std::move(task));
}

// ============================================================================
// upload_pool_factory implementation
// ============================================================================

std::shared_ptr<upload_thread_pool_interface> upload_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_upload_pool>();
#endif
}

}  // namespace kcenon::upload_orchestrator::adapters
