// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_control.cpp
 * @brief Implementation of the pause and cancel gate
 */

#include "kcenon/upload_orchestrator/core/transfer_control.h"

namespace kcenon::upload_orchestrator {

void transfer_control::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void transfer_control::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void transfer_control::cancel() {
    source_.request_cancellation();
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

auto transfer_control::is_paused() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

auto transfer_control::is_cancelled() const -> bool {
    return source_.is_cancellation_requested();
}

auto transfer_control::wait_until_runnable() -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || source_.is_cancellation_requested(); });
    return !source_.is_cancellation_requested();
}

}  // namespace kcenon::upload_orchestrator
