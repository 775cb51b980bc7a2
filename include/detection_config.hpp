#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

struct DetectionConfig {
  // On-chain program IDs
  static constexpr std::string_view pump_fun_program =
      "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P";
  static constexpr std::string_view raydium_amm_program =
      "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8";
  static constexpr std::string_view token_program =
      "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

  static constexpr std::string_view default_rpc_url =
      "https://api.mainnet-beta.solana.com";
  static constexpr std::string_view commitment = "confirmed";

  // Pump.fun mints exactly 1B base units on creation
  static constexpr std::string_view initial_supply_amount = "1000000000";

  // SPL mint account layout
  static constexpr size_t pubkey_size = 32;
  static constexpr size_t mint_authority_offset = 4;
  static constexpr size_t freeze_authority_offset = 36;

  // Log markers for the LP burn heuristic
  static constexpr std::string_view burn_marker = "Burn";
  static constexpr std::string_view liquidity_marker = "Raydium";
  static constexpr std::string_view launch_marker = "create";

  // Subscription reconnect backoff
  static constexpr std::chrono::milliseconds reconnect_base_delay{1000};
  static constexpr std::chrono::milliseconds reconnect_max_delay{30000};

  // A subscription silent this long (pings unanswered) counts as dropped
  static constexpr std::chrono::milliseconds subscription_idle_timeout{30000};

  // Backlog bound for both the feed buffer and the processor queues
  static constexpr size_t default_max_pending_launches = 1000;

  static constexpr size_t pump_fun_link_length = 44;
};

// Values read once at process start
struct RuntimeConfig {
  std::string rpc_url{DetectionConfig::default_rpc_url};
  std::string ws_url;
  unsigned int worker_threads = 0;
  std::chrono::milliseconds fetch_timeout{5000};
  std::chrono::milliseconds shutdown_grace{10000};
  size_t max_pending_launches = DetectionConfig::default_max_pending_launches;
  std::string redis_url;
  std::string redis_channel = "pump:rug_alerts";
  std::string log_level = "info";

  static RuntimeConfig fromEnv();
  void validate() const;
};

// https://host -> wss://host, http://host -> ws://host
std::string deriveWebsocketUrl(const std::string &rpc_url);
