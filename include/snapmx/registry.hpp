/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "snapmx/drivers.hpp"

namespace snapmx {

// An externally spawned process that must not outlive the run.
class ManagedResource {
public:
    virtual ~ManagedResource() = default;
    [[nodiscard]] virtual std::string describe() const = 0;
    virtual void stop() = 0;
};

class ManagedDevice final : public ManagedResource {
public:
    ManagedDevice(DeviceDriver& driver, std::string deviceId, std::string label);

    [[nodiscard]] std::string describe() const override;
    void stop() override;

    [[nodiscard]] const std::string& deviceId() const noexcept { return deviceId_; }

private:
    DeviceDriver& driver_;
    std::string deviceId_;
    std::string label_;
};

class ManagedAutomationServer final : public ManagedResource {
public:
    ManagedAutomationServer(SessionProvider& provider, int port);

    [[nodiscard]] std::string describe() const override;
    void stop() override;

    [[nodiscard]] int port() const noexcept { return port_; }

private:
    SessionProvider& provider_;
    int port_;
};

struct DrainReport {
    std::size_t stopped = 0;
    std::size_t failed = 0;
    bool timedOut = false;
};

// Thread-safe registry of live resources. Jobs register what they spawn and
// unregister on teardown; the lifecycle owner drains whatever is left.
class ProcessRegistry {
public:
    static constexpr std::chrono::milliseconds kDefaultDrainTimeout{30'000};

    ProcessRegistry() = default;
    ~ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;
    ProcessRegistry(ProcessRegistry&&) = delete;
    ProcessRegistry& operator=(ProcessRegistry&&) = delete;

    // False if the key is already registered.
    [[nodiscard]] bool registerResource(const std::string& key, std::shared_ptr<ManagedResource> resource);

    // Removes and returns the resource, or nullptr if absent (already
    // unregistered or taken by a drain). The caller stops it.
    [[nodiscard]] std::shared_ptr<ManagedResource> unregisterResource(const std::string& key);

    // Stops every registered resource, newest first, and empties the
    // registry. Returns once all stops finished or the timeout elapsed.
    DrainReport drain(std::chrono::milliseconds timeout = kDefaultDrainTimeout) noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    struct Entry {
        std::uint64_t sequence;
        std::shared_ptr<ManagedResource> resource;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> resources_;
    std::uint64_t nextSequence_ = 0;
};

}
