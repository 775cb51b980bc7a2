#include "detection_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

std::string getEnvVar(const char *name, const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return (value && *value) ? std::string(value) : default_value;
}

long getEnvNumber(const char *name, long default_value) {
  const char *value = std::getenv(name);
  if (!value || !*value)
    return default_value;
  try {
    return std::stol(value);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " is not a number: " + value);
  }
}

bool startsWith(const std::string &str, const std::string &prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string deriveWebsocketUrl(const std::string &rpc_url) {
  if (startsWith(rpc_url, "https://"))
    return "wss://" + rpc_url.substr(8);
  if (startsWith(rpc_url, "http://"))
    return "ws://" + rpc_url.substr(7);
  return rpc_url;
}

RuntimeConfig RuntimeConfig::fromEnv() {
  RuntimeConfig config;

  config.rpc_url =
      getEnvVar("SOLANA_RPC", std::string(DetectionConfig::default_rpc_url));
  config.ws_url = getEnvVar("SOLANA_WS", deriveWebsocketUrl(config.rpc_url));

  config.worker_threads = static_cast<unsigned int>(
      getEnvNumber("WORKER_THREADS",
                   std::min(std::thread::hardware_concurrency(), 64u)));
  if (config.worker_threads == 0)
    config.worker_threads = 1;

  config.fetch_timeout =
      std::chrono::milliseconds(getEnvNumber("FETCH_TIMEOUT_MS", 5000));
  config.shutdown_grace =
      std::chrono::milliseconds(getEnvNumber("SHUTDOWN_GRACE_MS", 10000));

  long max_pending = getEnvNumber(
      "MAX_PENDING_LAUNCHES",
      static_cast<long>(DetectionConfig::default_max_pending_launches));
  if (max_pending < 1) {
    throw std::invalid_argument("MAX_PENDING_LAUNCHES must be positive");
  }
  config.max_pending_launches = static_cast<size_t>(max_pending);

  config.redis_url = getEnvVar("REDIS_URL");
  config.redis_channel = getEnvVar("REDIS_CHANNEL", "pump:rug_alerts");
  config.log_level = getEnvVar("LOG_LEVEL", "info");

  return config;
}

void RuntimeConfig::validate() const {
  if (!startsWith(rpc_url, "https://") && !startsWith(rpc_url, "http://")) {
    throw std::invalid_argument("SOLANA_RPC must be an http(s) URL: " + rpc_url);
  }
  if (!startsWith(ws_url, "wss://") && !startsWith(ws_url, "ws://")) {
    throw std::invalid_argument("SOLANA_WS must be a ws(s) URL: " + ws_url);
  }
  if (worker_threads < 1 || worker_threads > 64) {
    throw std::invalid_argument("WORKER_THREADS must be between 1 and 64");
  }
  if (fetch_timeout.count() <= 0) {
    throw std::invalid_argument("FETCH_TIMEOUT_MS must be positive");
  }
  if (shutdown_grace.count() < 0) {
    throw std::invalid_argument("SHUTDOWN_GRACE_MS must not be negative");
  }
  if (max_pending_launches == 0) {
    throw std::invalid_argument("MAX_PENDING_LAUNCHES must be positive");
  }
  if (redis_channel.empty()) {
    throw std::invalid_argument("REDIS_CHANNEL must not be empty");
  }

  spdlog::debug("Configuration validated: rpc={}, ws={}, workers={}", rpc_url,
                ws_url, worker_threads);
}
