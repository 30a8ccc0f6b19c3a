/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace snapmx {

using JobProcessor = std::function<void(std::size_t jobIndex, int workerId)>;

// Fixed-size worker pool draining a FIFO of job indices.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(std::size_t jobIndex) noexcept;

    // Blocks until the queue is empty and no worker is processing.
    void waitIdle() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> active_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::condition_variable idle_;
    std::queue<std::size_t> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
