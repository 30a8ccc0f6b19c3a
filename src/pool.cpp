/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/pool.hpp"
#include "snapmx/logger.hpp"
#include <utility>

namespace snapmx {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load() && workerThreads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!jobQueue_.empty()) {
            LOG_DEBUG("Dropping " + std::to_string(jobQueue_.size()) + " queued jobs");
        }
        while (!jobQueue_.empty()) {
            jobQueue_.pop();
        }
    }
    idle_.notify_all();

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(std::size_t jobIndex) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + std::to_string(jobIndex));
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(jobIndex);
        }

        jobAvailable_.notify_one();
        LOG_TRACE("Job queued: " + std::to_string(jobIndex));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + std::to_string(jobIndex) + ": " + e.what());
        return false;
    }
}

void Pool::waitIdle() noexcept {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return (jobQueue_.empty() && active_.load() == 0) || shutdown_.load();
    });
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG(getThreadName(workerId) + " thread started");

    while (true) {
        std::size_t jobIndex = 0;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            jobIndex = jobQueue_.front();
            jobQueue_.pop();
            active_.fetch_add(1);
        }

        LOG_DEBUG(getThreadName(workerId) + " claimed job " + std::to_string(jobIndex));

        try {
            processor_(jobIndex, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                      std::string(e.what()) + " (job: " + std::to_string(jobIndex) + ")");
        } catch (...) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " unknown job processing error (job: " +
                      std::to_string(jobIndex) + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            active_.fetch_sub(1);
        }
        idle_.notify_all();
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
