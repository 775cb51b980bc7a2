#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "detection_result.hpp"
#include "launch_event.hpp"
#include "solana_rpc_client.hpp"

struct AuthorityField {
    bool decoded = false;   // false when the buffer is too short to hold it
    bool revoked = false;
    std::optional<std::string> holder;
};

struct MintAuthorityState {
    AuthorityField mint_authority;
    AuthorityField freeze_authority;
};

// Reads both authorities at their fixed offsets in the SPL mint layout
MintAuthorityState decodeMintAuthorities(std::span<const uint8_t> data);

// True if any line mentions both a burn and the Raydium AMM
bool hasLiquidityBurn(const std::vector<std::string>& log_lines);

namespace signs {
inline constexpr const char* mint_revoked = "Mint authority REVOKED (cannot mint more tokens)";
inline constexpr const char* freeze_revoked = "Freeze authority REVOKED (cannot freeze holders' tokens)";
inline constexpr const char* lp_burned = "Liquidity pool tokens BURNED (liquidity cannot be rugged)";
inline constexpr const char* lp_not_burned = "LP tokens NOT burned (high risk - dev can pull liquidity)";
inline constexpr const char* mint_info_unavailable =
    "Mint account info unavailable (could not fetch mint account)";

std::string mintAuthorityActive(const std::string& holder);
std::string freezeAuthorityActive(const std::string& holder);
} // namespace signs

class RiskEvaluator {
public:
    explicit RiskEvaluator(SolanaRpc& rpc) : rpc_(rpc) {}

    RiskVerdict evaluate(const ResolvedLaunch& launch,
                         const std::vector<std::string>& log_lines) const;

    // Verdict from data already in hand; nullopt account data means unavailable
    static RiskVerdict buildVerdict(const ResolvedLaunch& launch,
                                    const std::optional<std::vector<uint8_t>>& account_data,
                                    const std::vector<std::string>& log_lines);

private:
    std::optional<std::vector<uint8_t>> fetchMintAccount(const std::string& mint) const;

    SolanaRpc& rpc_;
};
