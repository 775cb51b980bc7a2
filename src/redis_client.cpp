#include "redis_client.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

void RedisAlertPublisher::emit(const RiskVerdict& verdict) {
    size_t index = counter_++ % pool_size_;
    auto& redis = connection_pool_[index];

    auto payload = toJson(verdict).dump();
    try {
        auto receivers = redis->publish(channel_, payload);
        spdlog::debug("Published verdict for {} to '{}' ({} subscribers)",
                      verdict.mint, channel_, receivers);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Redis error publishing verdict for {}: {}", verdict.mint, e.what());
    }
}
