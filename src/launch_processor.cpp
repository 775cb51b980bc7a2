#include "launch_processor.hpp"
#include <spdlog/spdlog.h>

LaunchProcessor::LaunchProcessor(const LaunchPipeline &pipeline,
                                 std::vector<std::shared_ptr<AlertSink>> sinks,
                                 size_t num_threads, size_t max_pending)
    : pipeline_(pipeline), sinks_(std::move(sinks)), workers_(),
      work_queues_(num_threads == 0 ? 1 : num_threads),
      queue_mutexes_(work_queues_.size()), queue_mutex_(), queue_cv_(),
      idle_cv_(), should_stop_(false), in_flight_(0),
      max_pending_(max_pending == 0 ? 1 : max_pending) {

  // Create threads
  for (size_t i = 0; i < work_queues_.size(); ++i) {
    workers_.emplace_back([this, i] { processLaunchWorker(i); });
  }
}

LaunchProcessor::~LaunchProcessor() { shutdown(std::chrono::milliseconds(0)); }

bool LaunchProcessor::addTask(LaunchEvent event) {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (should_stop_)
      return false;
  }

  size_t queue_index = round_robin_++ % work_queues_.size();
  if (pending_.load() >= max_pending_) {
    if (auto evicted = evictOldest(queue_index)) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      spdlog::warn("Launch backlog full ({} queued), dropping {}", max_pending_,
                   *evicted);
    }
  }

  {
    std::unique_lock<std::mutex> lock(queue_mutexes_[queue_index]);
    work_queues_[queue_index].push(std::move(event));
    pending_.fetch_add(1);
  }
  submitted_.fetch_add(1, std::memory_order_relaxed);

  // Take the wait mutex so a worker between its empty check and wait() cannot
  // miss the notification
  { std::unique_lock<std::mutex> lock(queue_mutex_); }
  queue_cv_.notify_one();
  return true;
}

void LaunchProcessor::shutdown(std::chrono::milliseconds grace) {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (should_stop_ && workers_.empty())
      return;
    should_stop_ = true;
  }

  size_t dropped = clearQueues();
  if (dropped > 0) {
    dropped_.fetch_add(dropped, std::memory_order_relaxed);
    spdlog::info("Dropped {} queued launches on shutdown", dropped);
  }
  queue_cv_.notify_all();

  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool drained =
        idle_cv_.wait_for(lock, grace, [this] { return in_flight_ == 0; });
    if (!drained) {
      spdlog::warn("{} launches still in flight after {}ms, abandoning them",
                   in_flight_, grace.count());
      abandoned_.store(true);
    }
  }

  // In-flight fetches are bounded by the RPC timeout
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  workers_.clear();
}

LaunchProcessor::Stats LaunchProcessor::stats() const {
  return {submitted_.load(std::memory_order_relaxed),
          emitted_.load(std::memory_order_relaxed),
          skipped_.load(std::memory_order_relaxed),
          failed_.load(std::memory_order_relaxed),
          dropped_.load(std::memory_order_relaxed)};
}

void LaunchProcessor::processLaunchWorker(size_t worker_id) {
  while (true) {
    LaunchEvent task;

    if (!popTask(worker_id, task)) {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      if (should_stop_) {
        return;
      }
      if (allQueuesEmpty()) {
        queue_cv_.wait(lock);
      }
      continue;
    }

    processLaunch(task);

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      --in_flight_;
    }
    idle_cv_.notify_all();
  }
}

bool LaunchProcessor::popTask(size_t worker_id, LaunchEvent &task) {
  // Own queue first, then steal from the others
  for (size_t n = 0; n < work_queues_.size(); ++n) {
    size_t i = (worker_id + n) % work_queues_.size();
    bool found_task = false;
    {
      std::unique_lock<std::mutex> lock(queue_mutexes_[i]);
      if (!work_queues_[i].empty()) {
        task = std::move(work_queues_[i].front());
        work_queues_[i].pop();
        pending_.fetch_sub(1);
        found_task = true;
      }
    }

    // queue_mutex_ is never taken while holding a per-queue mutex
    if (found_task) {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      ++in_flight_;
      return true;
    }
  }
  return false;
}

bool LaunchProcessor::allQueuesEmpty() const {
  for (size_t i = 0; i < work_queues_.size(); ++i) {
    std::unique_lock<std::mutex> lock(queue_mutexes_[i]);
    if (!work_queues_[i].empty())
      return false;
  }
  return true;
}

size_t LaunchProcessor::clearQueues() {
  size_t cleared = 0;
  for (size_t i = 0; i < work_queues_.size(); ++i) {
    std::unique_lock<std::mutex> lock(queue_mutexes_[i]);
    cleared += work_queues_[i].size();
    pending_.fetch_sub(work_queues_[i].size());
    work_queues_[i] = {};
  }
  return cleared;
}

std::optional<std::string> LaunchProcessor::evictOldest(size_t start_index) {
  // Front of the first non-empty queue, starting with the one about to grow
  for (size_t n = 0; n < work_queues_.size(); ++n) {
    size_t i = (start_index + n) % work_queues_.size();
    std::unique_lock<std::mutex> lock(queue_mutexes_[i]);
    if (!work_queues_[i].empty()) {
      std::string signature = std::move(work_queues_[i].front().signature);
      work_queues_[i].pop();
      pending_.fetch_sub(1);
      return signature;
    }
  }
  return std::nullopt;
}

void LaunchProcessor::processLaunch(const LaunchEvent &event) {
  spdlog::info("Processing launch candidate: {}", event.signature);

  auto outcome = pipeline_.process(event);

  if (outcome.ok()) {
    if (abandoned_.load()) {
      spdlog::debug("Discarding verdict for {} after shutdown grace period",
                    event.signature);
      return;
    }
    emit(*outcome.verdict);
    emitted_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  switch (outcome.error) {
  case LaunchError::NotFound:
  case LaunchError::MintNotIdentified:
    skipped_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("Skipping {}: {}", outcome.signature, outcome.detail);
    break;
  case LaunchError::Transport:
  case LaunchError::Timeout:
  case LaunchError::Decode:
    failed_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("Error processing transaction {} ({}): {}", outcome.signature,
                 toString(outcome.error), outcome.detail);
    break;
  case LaunchError::Unexpected:
    failed_.fetch_add(1, std::memory_order_relaxed);
    spdlog::error("Error processing transaction {}: {}", outcome.signature,
                  outcome.detail);
    break;
  }
}

void LaunchProcessor::emit(const RiskVerdict &verdict) {
  for (const auto &sink : sinks_) {
    try {
      sink->emit(verdict);
    } catch (const std::exception &e) {
      spdlog::error("Alert sink failed for {}: {}", verdict.mint, e.what());
    }
  }
}
