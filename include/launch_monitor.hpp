#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

#include "launch_processor.hpp"
#include "log_subscription.hpp"

// The single consumer loop: filters feed messages and hands launches to the
// processor without doing any RPC work itself.
class LaunchMonitor {
public:
    LaunchMonitor(LogFeed& feed, LaunchProcessor& processor,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250))
        : feed_(feed), processor_(processor), poll_interval_(poll_interval) {}

    // Runs until stop(); on exit shuts the processor down, then closes the feed
    void run(std::chrono::milliseconds shutdown_grace);

    // Safe to call from a signal handler
    void stop() { stop_requested_.store(true); }
    bool stopRequested() const { return stop_requested_.load(); }

    uint64_t launchesSeen() const { return launches_seen_.load(); }

private:
    LogFeed& feed_;
    LaunchProcessor& processor_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> launches_seen_{0};
};
