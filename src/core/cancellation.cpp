// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file cancellation.cpp
 * @brief Implementation of cancellation source and token
 */

#include "kcenon/upload_orchestrator/core/cancellation.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::upload_orchestrator {

namespace detail {

struct cancellation_state {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    cancellation_token::callback_id next_id = 1;
    std::map<cancellation_token::callback_id, std::function<void()>> callbacks;
};

}  // namespace detail

// ============================================================================
// cancellation_token
// ============================================================================

auto cancellation_token::is_cancellation_requested() const -> bool {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::wait_for(std::chrono::milliseconds timeout) const -> bool {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

auto cancellation_token::register_callback(std::function<void()> callback) const
    -> callback_id {
    if (!state_ || !callback) return 0;

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void cancellation_token::unregister_callback(callback_id id) const {
    if (!state_ || id == 0) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

// ============================================================================
// cancellation_source
// ============================================================================

cancellation_source::cancellation_source()
    : state_(std::make_shared<detail::cancellation_state>()) {}

void cancellation_source::request_cancellation() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        for (auto& [id, cb] : state_->callbacks) {
            to_run.push_back(std::move(cb));
        }
        state_->callbacks.clear();
    }
    state_->cv.notify_all();

    for (auto& cb : to_run) {
        cb();
    }
}

auto cancellation_source::is_cancellation_requested() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_source::get_token() const -> cancellation_token {
    return cancellation_token(state_);
}

}  // namespace kcenon::upload_orchestrator
