#pragma once

class LaunchMonitor;

// Routes SIGINT and SIGTERM to LaunchMonitor::stop() while in scope. Default
// handlers are restored on destruction, including during unwinding.
class ShutdownSignals {
public:
    explicit ShutdownSignals(LaunchMonitor& monitor);
    ~ShutdownSignals();

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;
};
