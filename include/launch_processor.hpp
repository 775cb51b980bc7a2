#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include "alert_sink.hpp"
#include "detection_config.hpp"
#include "launch_event.hpp"
#include "launch_pipeline.hpp"

// Bounded worker pool for per-launch pipelines. Each worker owns a queue and
// steals from the others when its own runs dry. At most `max_pending` launches
// wait in the queues; past that the front of a queue is dropped.
class LaunchProcessor {
public:
  struct Stats {
    uint64_t submitted = 0;
    uint64_t emitted = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;
  };

  LaunchProcessor(const LaunchPipeline &pipeline,
                  std::vector<std::shared_ptr<AlertSink>> sinks,
                  size_t num_threads,
                  size_t max_pending = DetectionConfig::default_max_pending_launches);
  ~LaunchProcessor();

  LaunchProcessor(const LaunchProcessor &) = delete;
  LaunchProcessor &operator=(const LaunchProcessor &) = delete;

  // Returns false once shutdown has begun. A full backlog evicts the oldest
  // launch of one queue to make room.
  bool addTask(LaunchEvent event);

  // Drops queued launches, waits up to `grace` for in-flight ones, then joins.
  // Verdicts finishing after the grace period are discarded.
  void shutdown(std::chrono::milliseconds grace);

  Stats stats() const;

private:
  void processLaunchWorker(size_t worker_id);
  bool popTask(size_t worker_id, LaunchEvent &task);
  bool allQueuesEmpty() const;
  size_t clearQueues();
  std::optional<std::string> evictOldest(size_t start_index);
  void processLaunch(const LaunchEvent &event);
  void emit(const RiskVerdict &verdict);

  const LaunchPipeline &pipeline_;
  std::vector<std::shared_ptr<AlertSink>> sinks_;

  // Member variables - order must match initialization order in constructor
  std::vector<std::thread> workers_;
  std::vector<std::queue<LaunchEvent>> work_queues_;
  mutable std::vector<std::mutex> queue_mutexes_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  bool should_stop_;
  size_t in_flight_;
  const size_t max_pending_;
  std::atomic<size_t> pending_{0};
  std::atomic<bool> abandoned_{false};
  std::atomic<size_t> round_robin_{0};

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> emitted_{0};
  std::atomic<uint64_t> skipped_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> dropped_{0};
};
