#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "alert_sink.hpp"
#include "detection_config.hpp"
#include "launch_monitor.hpp"
#include "launch_pipeline.hpp"
#include "launch_processor.hpp"
#include "log_subscription.hpp"
#include "redis_client.hpp"
#include "shutdown_signals.hpp"
#include "solana_rpc_client.hpp"

void setupLogger(const std::string &level, bool debug_mode) {
  auto console = spdlog::stdout_color_mt("console");
  spdlog::set_default_logger(console);
  spdlog::set_level(debug_mode ? spdlog::level::debug
                               : spdlog::level::from_str(level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char *argv[]) {
  bool debug_mode = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--debug") {
      debug_mode = true;
    } else {
      std::cerr << "Usage: " << argv[0] << " [--debug]" << std::endl;
      return 1;
    }
  }

  try {
    auto config = RuntimeConfig::fromEnv();
    setupLogger(config.log_level, debug_mode);
    config.validate();

    spdlog::info("Pump.fun rug detector starting");
    spdlog::info("RPC: {}", config.rpc_url);
    spdlog::info("Subscription: {}", config.ws_url);

    SolanaRpcClient rpc(config.rpc_url, config.fetch_timeout);
    LaunchPipeline pipeline(rpc);

    std::vector<std::shared_ptr<AlertSink>> sinks;
    sinks.push_back(std::make_shared<ConsoleAlertSink>());
    if (!config.redis_url.empty()) {
      spdlog::info("Publishing verdicts to Redis channel '{}'",
                   config.redis_channel);
      sinks.push_back(std::make_shared<RedisAlertPublisher>(
          config.redis_url, config.redis_channel));
    }

    spdlog::info("Starting launch processor with {} threads",
                 config.worker_threads);
    LaunchProcessor processor(pipeline, std::move(sinks),
                              config.worker_threads,
                              config.max_pending_launches);

    LogSubscription subscription(config.ws_url,
                                 std::string(DetectionConfig::pump_fun_program),
                                 config.max_pending_launches);
    subscription.start(config.fetch_timeout);

    LaunchMonitor monitor(subscription, processor);
    ShutdownSignals signals(monitor);
    monitor.run(config.shutdown_grace);

  } catch (const std::exception &e) {
    spdlog::error("Fatal error: {}", e.what());
    return 1;
  }

  spdlog::info("Rug detector has shut down gracefully.");
  return 0;
}
