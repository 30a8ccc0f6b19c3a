/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/lifecycle.hpp"
#include "snapmx/logger.hpp"
#include <cstdlib>
#include <string>

namespace snapmx {

volatile std::sig_atomic_t Lifecycle::signalCount_ = 0;
std::atomic<Lifecycle*> Lifecycle::installed_{nullptr};

namespace {
constexpr auto kWatchInterval = std::chrono::milliseconds(100);
}

Lifecycle::Lifecycle(ProcessRegistry& registry, CancellationSource& source,
                     std::chrono::milliseconds drainTimeout) noexcept
    : registry_(registry), source_(source), drainTimeout_(drainTimeout) {}

Lifecycle::~Lifecycle() {
    stopWatcher_.store(true);
    if (watcher_.joinable()) {
        watcher_.join();
    }

    if (installedHere_) {
        std::signal(SIGINT, previousSigint_);
        std::signal(SIGTERM, previousSigterm_);
        std::set_terminate(previousTerminate_);
        installed_.store(nullptr);
        signalCount_ = 0;
    }

    drain();
}

bool Lifecycle::install() {
    Lifecycle* expected = nullptr;
    if (!installed_.compare_exchange_strong(expected, this)) {
        LOG_ERROR("Another lifecycle owner is already installed");
        return false;
    }
    installedHere_ = true;
    signalCount_ = 0;

    previousSigint_ = std::signal(SIGINT, signalHandler);
    if (previousSigint_ == SIG_ERR) {
        previousSigint_ = SIG_DFL;
    }
    previousSigterm_ = std::signal(SIGTERM, signalHandler);
    if (previousSigterm_ == SIG_ERR) {
        previousSigterm_ = SIG_DFL;
    }
    previousTerminate_ = std::set_terminate(terminateHandler);

    try {
        watcher_ = std::thread(&Lifecycle::watch, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start signal watcher: " + std::string(e.what()));
        return false;
    }
    LOG_DEBUG("Lifecycle hooks installed");
    return true;
}

void Lifecycle::signalHandler(int signal) {
    (void)signal;
    if (signalCount_ < 2) {
        signalCount_ = signalCount_ + 1;
    }
}

void Lifecycle::terminateHandler() {
    Lifecycle* owner = installed_.load();
    if (owner) {
        LOG_ERROR("Fatal error, draining managed resources before exit");
        owner->drain();
        if (owner->previousTerminate_) {
            owner->previousTerminate_();
        }
    }
    std::abort();
}

void Lifecycle::watch() {
    setThreadName("Lifecycle");
    bool cancelled = false;
    while (!stopWatcher_.load()) {
        std::sig_atomic_t seen = signalCount_;
        if (seen > 0 && !cancelled) {
            LOG_WARN("Shutdown requested, cancelling run (signal again to force exit)");
            source_.cancel();
            cancelled = true;
        }
        // A hung job can ignore the token; the second signal stops everything
        if (seen > 1) {
            LOG_ERROR("Shutdown requested again, draining managed resources");
            auto report = drain();
            LOG_ERROR("Forced exit: " + std::to_string(report.stopped) + " stopped, " +
                      std::to_string(report.failed) + " failed");
            std::_Exit(kForcedExitCode);
        }
        std::this_thread::sleep_for(kWatchInterval);
    }
}

DrainReport Lifecycle::drain() noexcept {
    if (registry_.empty()) {
        return {};
    }
    return registry_.drain(drainTimeout_);
}

}
