/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <thread>

#include "snapmx/cancel.hpp"
#include "snapmx/registry.hpp"

namespace snapmx {

// Process-level owner of the exit paths. The first signal cancels the run,
// a second one drains synchronously and exits with kForcedExitCode. A fatal
// std::terminate drains before aborting, and destruction drains on normal
// exit. Only one instance may be installed at a time.
class Lifecycle {
public:
    static constexpr int kForcedExitCode = 130;

    Lifecycle(ProcessRegistry& registry, CancellationSource& source,
              std::chrono::milliseconds drainTimeout = ProcessRegistry::kDefaultDrainTimeout) noexcept;
    ~Lifecycle();

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;
    Lifecycle(Lifecycle&&) = delete;
    Lifecycle& operator=(Lifecycle&&) = delete;

    // Installs SIGINT/SIGTERM handlers, the terminate hook and the watcher.
    [[nodiscard]] bool install();

    [[nodiscard]] static bool shutdownRequested() noexcept { return signalCount_ != 0; }

    DrainReport drain() noexcept;

private:
    static void signalHandler(int signal);
    static void terminateHandler();
    void watch();

    // Async-signal-safe: the handler only bumps this counter
    static volatile std::sig_atomic_t signalCount_;
    static std::atomic<Lifecycle*> installed_;

    ProcessRegistry& registry_;
    CancellationSource& source_;
    std::chrono::milliseconds drainTimeout_;

    std::atomic<bool> stopWatcher_{false};
    std::thread watcher_;
    std::terminate_handler previousTerminate_ = nullptr;
    void (*previousSigint_)(int) = SIG_DFL;
    void (*previousSigterm_)(int) = SIG_DFL;
    bool installedHere_ = false;
};

}
