#include "launch_monitor.hpp"
#include "launch_filter.hpp"
#include <spdlog/spdlog.h>

void LaunchMonitor::run(std::chrono::milliseconds shutdown_grace) {
  spdlog::info("Listening for new Pump.fun tokens...");

  LaunchEvent event;
  while (!stop_requested_.load()) {
    if (!feed_.next(event, poll_interval_)) {
      if (!feed_.isOpen()) {
        spdlog::error("Log feed closed unexpectedly");
        break;
      }
      continue;
    }

    if (!isLaunchEvent(event.log_lines)) {
      spdlog::debug("Ignoring non-creation event {}", event.signature);
      continue;
    }

    launches_seen_.fetch_add(1);
    spdlog::info("New Pump.fun launch detected: {}", event.signature);
    if (!processor_.addTask(std::move(event))) {
      spdlog::warn("Processor is shutting down, launch dropped");
    }
    event = LaunchEvent{};
  }

  // No more hand-offs from here; in-flight launches get the grace period
  // before the subscription is released
  spdlog::info("Stopping launch monitor");
  processor_.shutdown(shutdown_grace);
  feed_.close();

  auto stats = processor_.stats();
  spdlog::info("Launches: {} seen, {} evaluated, {} skipped, {} failed, {} dropped",
               launches_seen_.load(), stats.emitted, stats.skipped, stats.failed,
               stats.dropped);
}
