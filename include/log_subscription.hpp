#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "detection_config.hpp"
#include "launch_event.hpp"
#include "solana_rpc_client.hpp"

// Source of raw program-log messages consumed by the monitor loop
class LogFeed {
public:
    virtual ~LogFeed() = default;

    // Blocks up to `wait` for the next message; false on timeout or once closed
    virtual bool next(LaunchEvent& event, std::chrono::milliseconds wait) = 0;
    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

// Builds the logsSubscribe request for programs mentioning `program_id`
std::string makeLogsSubscribeRequest(const std::string& program_id, int request_id);

// Parses one websocket frame; nullopt for anything other than a logsNotification
std::optional<LaunchEvent> parseLogsNotification(const std::string& payload);

// logsSubscribe over a websocket held by a dedicated reader thread. Drops are
// retried with exponential backoff; messages missed while disconnected are lost.
// At most `max_pending` messages are buffered; the oldest give way to new ones.
class LogSubscription : public LogFeed {
public:
    LogSubscription(const std::string& ws_url, std::string program_id,
                    size_t max_pending = DetectionConfig::default_max_pending_launches);
    ~LogSubscription() override;

    LogSubscription(const LogSubscription&) = delete;
    LogSubscription& operator=(const LogSubscription&) = delete;

    // Connects and subscribes; throws std::runtime_error if the first attempt fails.
    // A connection that stays silent for `idle_timeout` is treated as dropped.
    void start(std::chrono::milliseconds connect_timeout,
               std::chrono::milliseconds idle_timeout = DetectionConfig::subscription_idle_timeout);

    bool next(LaunchEvent& event, std::chrono::milliseconds wait) override;
    bool isOpen() const override { return !closed_.load(); }
    void close() override;

    uint64_t reconnects() const { return reconnects_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void readerLoop(std::promise<void> first_connect);
    void push(LaunchEvent event);

    struct Session;

    Endpoint endpoint_;
    std::string program_id_;
    std::chrono::milliseconds connect_timeout_{5000};
    std::chrono::milliseconds idle_timeout_{DetectionConfig::subscription_idle_timeout};
    size_t max_pending_;

    std::unique_ptr<Session> session_;
    std::thread reader_;
    std::future<void> reader_done_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> reconnects_{0};
    std::atomic<uint64_t> dropped_{0};

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<LaunchEvent> pending_;
};
