/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "snapmx/cancel.hpp"
#include "snapmx/config.hpp"

namespace snapmx {

struct RunJob;
struct SessionCapabilities;

// Simulator / emulator control for one platform. Failures are reported by
// throwing (ProvisioningError or any std::exception).
class DeviceDriver {
public:
    virtual ~DeviceDriver() = default;

    // Boots the device named by `deviceRef` (udid, simulator name or AVD)
    // and returns the runtime id (udid or emulator serial).
    virtual std::string boot(const std::string& deviceRef,
                             std::chrono::milliseconds timeout,
                             const CancellationToken& token) = 0;
    virtual void shutdown(const std::string& deviceId) = 0;

    virtual void setLocale(const std::string& deviceId, const std::string& locale,
                           const CancellationToken& token) = 0;
    virtual void installApp(const std::string& deviceId, const std::filesystem::path& app,
                            const CancellationToken& token) = 0;
    virtual void setStatusBar(const std::string& deviceId, const StatusBarConfig& statusBar,
                              const CancellationToken& token) = 0;
    virtual void resetAppData(const std::string& deviceId, const std::string& package,
                              const CancellationToken& token) = 0;

    [[nodiscard]] virtual std::vector<std::uint8_t> screenshot(const std::string& deviceId) = 0;
    [[nodiscard]] virtual std::string deviceLogs(const std::string& deviceId) = 0;
};

using ElementId = std::string;

// One UI automation session bound to a booted device.
class AutomationSession {
public:
    virtual ~AutomationSession() = default;

    // Returns nullopt when nothing matches within `timeout`.
    [[nodiscard]] virtual std::optional<ElementId> findElement(const Selector& selector,
                                                             std::chrono::milliseconds timeout,
                                                             const CancellationToken& token) = 0;
    virtual void click(const ElementId& element) = 0;
    // Polls until the element is present; false on timeout.
    [[nodiscard]] virtual bool waitFor(const Selector& selector,
                                       std::chrono::milliseconds timeout,
                                       const CancellationToken& token) = 0;
    virtual void setOrientation(Orientation orientation) = 0;
    [[nodiscard]] virtual std::string pageSource() = 0;
};

// Automation server processes and the sessions created on them.
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    virtual void startServer(int port, const CancellationToken& token) = 0;
    virtual void stopServer(int port) = 0;
    [[nodiscard]] virtual std::unique_ptr<AutomationSession> createSession(
        const RunJob& job, const SessionCapabilities& capabilities,
        const CancellationToken& token) = 0;
};

class ImageInspector {
public:
    virtual ~ImageInspector() = default;
    [[nodiscard]] virtual std::optional<Dimensions> dimensions(const std::filesystem::path& image) const = 0;
};

}
