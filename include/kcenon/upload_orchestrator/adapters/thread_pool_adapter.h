// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for upload_orchestrator
 *
 * Worker loops of the direct path, chunk sub-workers and the session runner
 * execute on pools obtained through this adapter, so the orchestrator runs
 * on thread_system when it is available and on std::async otherwise.
 */

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::upload_orchestrator::adapters {

/**
 * @brief Interface for thread pool operations in upload_orchestrator
 */
class upload_thread_pool_interface {
public:
    virtual ~upload_thread_pool_interface() = default;

    /**
     * @brief Submit a task tagged with a stage name
     * @param task The task to execute
     * @param stage_name Stage name (e.g., "chunk_worker"), used as the job name
     * @return Future for the task completion; rethrows what the task threw
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: submit_to_stage may be called from multiple threads.
 */
class thread_system_upload_adapter : public upload_thread_pool_interface {
public:
    explicit thread_system_upload_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool);

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_adapter> create_default(
        size_t worker_count,
        const std::string& pool_name);

    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every submitted task gets its own thread. Callers bound concurrency
 * themselves by submitting at most as many long-running worker loops as
 * they want running.
 */
class async_upload_pool : public upload_thread_pool_interface {
public:
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;
};

/**
 * @brief Factory for creating the appropriate thread pool adapter
 *
 * 1. thread_system_upload_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_upload_pool (fallback)
 */
class upload_pool_factory {
public:
    /**
     * @brief Create the best available thread pool adapter
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<upload_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "upload_pool");
};

}  // namespace kcenon::upload_orchestrator::adapters
