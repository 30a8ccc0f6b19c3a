/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/registry.hpp"
#include "snapmx/logger.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <utility>

namespace snapmx {

ManagedDevice::ManagedDevice(DeviceDriver& driver, std::string deviceId, std::string label)
    : driver_(driver), deviceId_(std::move(deviceId)), label_(std::move(label)) {}

std::string ManagedDevice::describe() const {
    return "device " + label_ + " (" + deviceId_ + ")";
}

void ManagedDevice::stop() {
    driver_.shutdown(deviceId_);
}

ManagedAutomationServer::ManagedAutomationServer(SessionProvider& provider, int port)
    : provider_(provider), port_(port) {}

std::string ManagedAutomationServer::describe() const {
    return "automation server on port " + std::to_string(port_);
}

void ManagedAutomationServer::stop() {
    provider_.stopServer(port_);
}

bool ProcessRegistry::registerResource(const std::string& key, std::shared_ptr<ManagedResource> resource) {
    if (!resource) {
        return false;
    }
    std::string description = resource->describe();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resources_.count(key)) {
            LOG_WARN("Resource already registered: " + key);
            return false;
        }
        resources_.emplace(key, Entry{nextSequence_++, std::move(resource)});
    }
    LOG_DEBUG("Registered " + description + " as " + key);
    return true;
}

std::shared_ptr<ManagedResource> ProcessRegistry::unregisterResource(const std::string& key) {
    std::shared_ptr<ManagedResource> resource;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = resources_.find(key);
        if (it == resources_.end()) {
            return nullptr;
        }
        resource = std::move(it->second.resource);
        resources_.erase(it);
    }
    LOG_DEBUG("Unregistered " + key);
    return resource;
}

std::size_t ProcessRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.size();
}

std::vector<std::string> ProcessRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(resources_.size());
    for (const auto& [key, entry] : resources_) {
        out.push_back(key);
    }
    return out;
}

DrainReport ProcessRegistry::drain(std::chrono::milliseconds timeout) noexcept {
    DrainReport report;
    try {
        std::vector<std::pair<std::string, Entry>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.assign(resources_.begin(), resources_.end());
            resources_.clear();
        }
        if (pending.empty()) {
            return report;
        }

        std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
            return a.second.sequence > b.second.sequence;
        });
        LOG_INFO("Draining " + std::to_string(pending.size()) + " managed resources");

        // Counters outlive this call if the stopper thread is abandoned
        struct Progress {
            std::atomic<std::size_t> stopped{0};
            std::atomic<std::size_t> failed{0};
        };
        auto progress = std::make_shared<Progress>();

        std::packaged_task<void()> task([pending, progress]() {
            for (const auto& [key, entry] : pending) {
                try {
                    entry.resource->stop();
                    progress->stopped.fetch_add(1);
                    LOG_DEBUG("Stopped " + entry.resource->describe());
                } catch (const std::exception& e) {
                    progress->failed.fetch_add(1);
                    LOG_WARN("Failed to stop " + key + ": " + std::string(e.what()));
                }
            }
        });
        auto done = task.get_future();
        std::thread stopper(std::move(task));

        if (done.wait_for(timeout) == std::future_status::ready) {
            stopper.join();
        } else {
            stopper.detach();
            report.timedOut = true;
            LOG_ERROR("Drain timed out after " + std::to_string(timeout.count()) + "ms");
        }

        report.stopped = progress->stopped.load();
        report.failed = progress->failed.load();
        LOG_INFO("Drain finished: " + std::to_string(report.stopped) + " stopped, " +
                 std::to_string(report.failed) + " failed");
    } catch (const std::exception& e) {
        LOG_ERROR("Drain error: " + std::string(e.what()));
    }
    return report;
}

}
