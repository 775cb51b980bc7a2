#include "shutdown_signals.hpp"
#include "launch_monitor.hpp"

#include <atomic>
#include <csignal>

namespace {

std::atomic<LaunchMonitor*> active_monitor{nullptr};

void signalHandler(int) {
    if (auto* monitor = active_monitor.load()) {
        monitor->stop();
    }
}

} // namespace

ShutdownSignals::ShutdownSignals(LaunchMonitor& monitor) {
    active_monitor.store(&monitor);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

ShutdownSignals::~ShutdownSignals() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    active_monitor.store(nullptr);
}
