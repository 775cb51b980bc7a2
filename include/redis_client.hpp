#pragma once
#include "alert_sink.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <sw/redis++/redis++.h>
#include <vector>

// Publishes verdicts as JSON on a pub/sub channel. Nothing is stored.
class RedisAlertPublisher : public AlertSink {
public:
    // Pool connections so concurrent workers do not serialize on one socket
    RedisAlertPublisher(const std::string& url, std::string channel, size_t pool_size = 4)
        : pool_size_(pool_size), channel_(std::move(channel)) {
        connection_pool_.reserve(pool_size);
        for (size_t i = 0; i < pool_size; ++i) {
            connection_pool_.emplace_back(std::make_unique<sw::redis::Redis>(url));
        }
    }

    void emit(const RiskVerdict& verdict) override;

private:
    size_t pool_size_;
    std::string channel_;
    std::vector<std::unique_ptr<sw::redis::Redis>> connection_pool_;
    std::atomic<size_t> counter_{0};
};
