#include "risk_evaluator.hpp"
#include "detection_config.hpp"
#include "encoding.hpp"
#include "pipeline_error.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

AuthorityField decodeAuthority(std::span<const uint8_t> data, size_t offset) {
  AuthorityField field;
  if (data.size() < offset + DetectionConfig::pubkey_size) {
    return field;
  }

  auto key = data.subspan(offset, DetectionConfig::pubkey_size);
  field.decoded = true;
  // The all-zero key is the default pubkey, i.e. no authority
  field.revoked = std::all_of(key.begin(), key.end(),
                              [](uint8_t byte) { return byte == 0; });
  if (!field.revoked) {
    field.holder = base58Encode(key);
  }
  return field;
}

} // namespace

MintAuthorityState decodeMintAuthorities(std::span<const uint8_t> data) {
  MintAuthorityState state;
  state.mint_authority =
      decodeAuthority(data, DetectionConfig::mint_authority_offset);
  state.freeze_authority =
      decodeAuthority(data, DetectionConfig::freeze_authority_offset);
  return state;
}

bool hasLiquidityBurn(const std::vector<std::string> &log_lines) {
  return std::any_of(
      log_lines.begin(), log_lines.end(), [](const std::string &line) {
        return line.find(DetectionConfig::burn_marker) != std::string::npos &&
               line.find(DetectionConfig::liquidity_marker) != std::string::npos;
      });
}

namespace signs {

std::string mintAuthorityActive(const std::string &holder) {
  return fmt::format("Mint authority ACTIVE: {} (high risk - dev can dilute supply)",
                     holder);
}

std::string freezeAuthorityActive(const std::string &holder) {
  return fmt::format("Freeze authority ACTIVE: {} (high risk - dev can freeze wallets)",
                     holder);
}

} // namespace signs

RiskVerdict RiskEvaluator::evaluate(const ResolvedLaunch &launch,
                                    const std::vector<std::string> &log_lines) const {
  return buildVerdict(launch, fetchMintAccount(launch.mint), log_lines);
}

std::optional<std::vector<uint8_t>>
RiskEvaluator::fetchMintAccount(const std::string &mint) const {
  try {
    return rpc_.getAccountData(mint);
  } catch (const PipelineError &e) {
    // Unavailable account info is a red flag, not a failed launch
    spdlog::warn("Mint account fetch failed for {} ({}): {}", mint,
                 toString(e.kind()), e.what());
    return std::nullopt;
  } catch (const nlohmann::json::exception &e) {
    spdlog::warn("Mint account fetch failed for {} (decode): {}", mint, e.what());
    return std::nullopt;
  }
}

RiskVerdict RiskEvaluator::buildVerdict(
    const ResolvedLaunch &launch,
    const std::optional<std::vector<uint8_t>> &account_data,
    const std::vector<std::string> &log_lines) {

  RiskVerdict verdict;
  verdict.signature = launch.signature;
  verdict.mint = launch.mint;
  verdict.creator = launch.creator;

  // Authority checks come before the liquidity check
  if (account_data && !account_data->empty()) {
    auto state = decodeMintAuthorities(*account_data);

    if (state.mint_authority.decoded) {
      if (state.mint_authority.revoked) {
        verdict.good_signs.emplace_back(signs::mint_revoked);
      } else {
        verdict.red_flags.push_back(
            signs::mintAuthorityActive(*state.mint_authority.holder));
      }
    }

    if (state.freeze_authority.decoded) {
      if (state.freeze_authority.revoked) {
        verdict.good_signs.emplace_back(signs::freeze_revoked);
      } else {
        verdict.red_flags.push_back(
            signs::freezeAuthorityActive(*state.freeze_authority.holder));
      }
    }
  } else {
    verdict.red_flags.emplace_back(signs::mint_info_unavailable);
  }

  if (hasLiquidityBurn(log_lines)) {
    verdict.good_signs.emplace_back(signs::lp_burned);
  } else {
    verdict.red_flags.emplace_back(signs::lp_not_burned);
  }

  verdict.high_risk = !verdict.red_flags.empty();
  return verdict;
}
