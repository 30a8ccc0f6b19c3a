/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

namespace snapmx {

namespace detail {
struct CancelState {
    std::mutex mutex;
    std::condition_variable changed;
    bool cancelled = false;
};
}

// Observer side of a cancellation flag. Cheap to copy; every copy sees the
// same flag. A default-constructed token never cancels.
class CancellationToken {
public:
    CancellationToken() noexcept = default;

    [[nodiscard]] bool cancelled() const noexcept;

    // Sleeps up to `duration`; returns true early if cancelled.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds duration) const;

    // Throws CancelledError when cancelled.
    void throwIfCancelled() const;

    [[nodiscard]] static CancellationToken none() noexcept { return CancellationToken(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] CancellationToken token() const noexcept { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancelState> state_;
};

}
