/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/cancel.hpp"
#include "snapmx/errors.hpp"
#include "snapmx/logger.hpp"
#include <thread>

namespace snapmx {

bool CancellationToken::cancelled() const noexcept {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (duration.count() <= 0) {
        return cancelled();
    }
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->changed.wait_for(lock, duration, [this] { return state_->cancelled; });
}

void CancellationToken::throwIfCancelled() const {
    if (cancelled()) {
        throw CancelledError();
    }
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

void CancellationSource::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
    }
    state_->changed.notify_all();
    LOG_INFO("Cancellation requested");
}

bool CancellationSource::cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}
