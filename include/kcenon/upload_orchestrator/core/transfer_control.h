// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file transfer_control.h
 * @brief Session-wide pause and cancel gate
 */

#pragma once

#include "kcenon/upload_orchestrator/core/cancellation.h"

#include <condition_variable>
#include <mutex>

namespace kcenon::upload_orchestrator {

/**
 * @brief Pause/resume/cancel gate shared by the workers of one session
 *
 * Pausing stops workers from picking up new tasks; work already in flight
 * runs to its own completion. Cancelling also releases paused workers.
 */
class transfer_control {
public:
    transfer_control() = default;

    transfer_control(const transfer_control&) = delete;
    auto operator=(const transfer_control&) -> transfer_control& = delete;

    void pause();
    void resume();
    void cancel();

    [[nodiscard]] auto is_paused() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Block while paused
     * @return false if the session was cancelled, true when work may proceed
     */
    [[nodiscard]] auto wait_until_runnable() -> bool;

    [[nodiscard]] auto token() const -> cancellation_token { return source_.get_token(); }

private:
    cancellation_source source_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
};

}  // namespace kcenon::upload_orchestrator
