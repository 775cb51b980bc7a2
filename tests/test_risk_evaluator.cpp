#include "risk_evaluator.hpp"
#include "encoding.hpp"
#include "launch_pipeline.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

using testing_support::FakeRpc;
using testing_support::makeMintAccount;
using testing_support::makeTransaction;

namespace {

const std::vector<std::string> kBurnLogs = {
    "Program log: Instruction: Burn",
    "Program log: Burn LP tokens via Raydium AMM",
};

const std::vector<std::string> kNoBurnLogs = {
    "Program log: Instruction: Create",
    "Program log: Instruction: Buy",
};

ResolvedLaunch sampleLaunch() {
    return ResolvedLaunch{"sig1", "Creator111", "MintA"};
}

std::string encodedFill(uint8_t fill) {
    std::vector<uint8_t> key(32, fill);
    return base58Encode(key);
}

} // namespace

TEST(mint_authorities, zero_keys_are_revoked) {
    auto state = decodeMintAuthorities(makeMintAccount(0, 0));
    EXPECT_TRUE(state.mint_authority.decoded);
    EXPECT_TRUE(state.mint_authority.revoked);
    EXPECT_FALSE(state.mint_authority.holder.has_value());
    EXPECT_TRUE(state.freeze_authority.decoded);
    EXPECT_TRUE(state.freeze_authority.revoked);
}

TEST(mint_authorities, nonzero_key_is_active_with_holder) {
    auto state = decodeMintAuthorities(makeMintAccount(7, 0));
    EXPECT_TRUE(state.mint_authority.decoded);
    EXPECT_FALSE(state.mint_authority.revoked);
    ASSERT_TRUE(state.mint_authority.holder.has_value());
    EXPECT_EQ(*state.mint_authority.holder, encodedFill(7));
    EXPECT_TRUE(state.freeze_authority.revoked);
}

TEST(mint_authorities, single_nonzero_byte_makes_authority_active) {
    auto data = makeMintAccount(0, 0);
    data[67] = 1;
    auto state = decodeMintAuthorities(data);
    EXPECT_TRUE(state.mint_authority.revoked);
    EXPECT_FALSE(state.freeze_authority.revoked);
}

TEST(mint_authorities, offsets_are_fixed) {
    // Bytes outside [4, 68) never influence either authority
    auto data = makeMintAccount(0, 0);
    std::fill(data.begin(), data.begin() + 4, 0xFF);
    std::fill(data.begin() + 68, data.end(), 0xFF);
    auto state = decodeMintAuthorities(data);
    EXPECT_TRUE(state.mint_authority.revoked);
    EXPECT_TRUE(state.freeze_authority.revoked);
}

TEST(mint_authorities, short_buffers_are_undetermined) {
    std::vector<uint8_t> tiny(35, 1);
    auto state = decodeMintAuthorities(tiny);
    EXPECT_FALSE(state.mint_authority.decoded);
    EXPECT_FALSE(state.mint_authority.revoked);
    EXPECT_FALSE(state.freeze_authority.decoded);

    std::vector<uint8_t> mint_only(67, 0);
    state = decodeMintAuthorities(mint_only);
    EXPECT_TRUE(state.mint_authority.decoded);
    EXPECT_TRUE(state.mint_authority.revoked);
    EXPECT_FALSE(state.freeze_authority.decoded);
    EXPECT_FALSE(state.freeze_authority.revoked);

    std::vector<uint8_t> exact(68, 0);
    state = decodeMintAuthorities(exact);
    EXPECT_TRUE(state.freeze_authority.decoded);
}

TEST(liquidity_burn, needs_burn_and_raydium_on_one_line) {
    EXPECT_TRUE(hasLiquidityBurn(kBurnLogs));
    EXPECT_FALSE(hasLiquidityBurn(kNoBurnLogs));
    EXPECT_FALSE(hasLiquidityBurn({"Program log: Burn", "Program log: Raydium swap"}));
    EXPECT_FALSE(hasLiquidityBurn({"burn via raydium"}));
    EXPECT_FALSE(hasLiquidityBurn({}));
}

TEST(risk_verdict, both_revoked_and_lp_burned_is_safer) {
    auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), makeMintAccount(0, 0), kBurnLogs);

    std::vector<std::string> expected_good = {signs::mint_revoked, signs::freeze_revoked,
                                              signs::lp_burned};
    EXPECT_EQ(verdict.good_signs, expected_good);
    EXPECT_TRUE(verdict.red_flags.empty());
    EXPECT_FALSE(verdict.high_risk);
    EXPECT_EQ(verdict.mint, "MintA");
    EXPECT_EQ(verdict.creator, "Creator111");
    EXPECT_EQ(verdict.signature, "sig1");
}

TEST(risk_verdict, active_mint_authority_and_no_burn_is_high_risk) {
    auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), makeMintAccount(9, 0), kNoBurnLogs);

    std::vector<std::string> expected_good = {signs::freeze_revoked};
    std::vector<std::string> expected_red = {signs::mintAuthorityActive(encodedFill(9)),
                                             signs::lp_not_burned};
    EXPECT_EQ(verdict.good_signs, expected_good);
    EXPECT_EQ(verdict.red_flags, expected_red);
    EXPECT_TRUE(verdict.high_risk);
    EXPECT_EQ(verdict.red_flags[0].rfind("Mint authority ACTIVE: " + encodedFill(9), 0), 0u);
    EXPECT_EQ(verdict.red_flags[1].rfind("LP tokens NOT burned", 0), 0u);
}

TEST(risk_verdict, authority_flags_precede_liquidity_flag) {
    auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), makeMintAccount(3, 4), kNoBurnLogs);

    ASSERT_EQ(verdict.red_flags.size(), 3u);
    EXPECT_EQ(verdict.red_flags[0], signs::mintAuthorityActive(encodedFill(3)));
    EXPECT_EQ(verdict.red_flags[1], signs::freezeAuthorityActive(encodedFill(4)));
    EXPECT_EQ(verdict.red_flags[2], signs::lp_not_burned);
    EXPECT_TRUE(verdict.good_signs.empty());
}

TEST(risk_verdict, missing_account_is_flagged_regardless_of_burn) {
    for (const auto& logs : {kBurnLogs, kNoBurnLogs}) {
        auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), std::nullopt, logs);
        ASSERT_FALSE(verdict.red_flags.empty());
        EXPECT_EQ(verdict.red_flags.front(), signs::mint_info_unavailable);
        EXPECT_TRUE(verdict.high_risk);
    }
}

TEST(risk_verdict, empty_account_data_counts_as_unavailable) {
    auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), std::vector<uint8_t>{}, kBurnLogs);
    std::vector<std::string> expected_red = {signs::mint_info_unavailable};
    EXPECT_EQ(verdict.red_flags, expected_red);
}

TEST(risk_verdict, short_account_skips_authority_checks) {
    auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), std::vector<uint8_t>(20, 5),
                                               kBurnLogs);
    std::vector<std::string> expected_good = {signs::lp_burned};
    EXPECT_EQ(verdict.good_signs, expected_good);
    EXPECT_TRUE(verdict.red_flags.empty());
    EXPECT_FALSE(verdict.high_risk);
}

TEST(risk_verdict, high_risk_iff_any_red_flag) {
    const std::vector<std::optional<std::vector<uint8_t>>> accounts = {
        std::nullopt,
        std::vector<uint8_t>(10, 1),
        std::vector<uint8_t>(40, 1),
        makeMintAccount(0, 0),
        makeMintAccount(1, 0),
        makeMintAccount(0, 1),
        makeMintAccount(1, 1),
    };
    for (const auto& account : accounts) {
        for (const auto& logs : {kBurnLogs, kNoBurnLogs}) {
            auto verdict = RiskEvaluator::buildVerdict(sampleLaunch(), account, logs);
            EXPECT_EQ(verdict.high_risk, !verdict.red_flags.empty());
        }
    }
}

TEST(risk_evaluator, evaluation_is_idempotent) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.accounts["MintA"] = makeMintAccount(2, 0);
    RiskEvaluator evaluator(rpc);

    auto first = evaluator.evaluate(sampleLaunch(), kNoBurnLogs);
    auto second = evaluator.evaluate(sampleLaunch(), kNoBurnLogs);
    EXPECT_EQ(first, second);
    EXPECT_EQ(rpc.account_calls.load(), 2);
}

TEST(risk_evaluator, fetch_failure_becomes_red_flag) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.account_failure = LaunchError::Timeout;
    RiskEvaluator evaluator(rpc);

    auto verdict = evaluator.evaluate(sampleLaunch(), kBurnLogs);
    std::vector<std::string> expected_red = {signs::mint_info_unavailable};
    std::vector<std::string> expected_good = {signs::lp_burned};
    EXPECT_EQ(verdict.red_flags, expected_red);
    EXPECT_EQ(verdict.good_signs, expected_good);
    EXPECT_TRUE(verdict.high_risk);
}

TEST(launch_pipeline, produces_verdict_for_resolvable_launch) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.transactions["sig1"] = makeTransaction("Creator111", {{"MintA", "1000000000"}});
    rpc.accounts["MintA"] = makeMintAccount(0, 0);
    LaunchPipeline pipeline(rpc);

    auto outcome = pipeline.process(LaunchEvent{"sig1", kBurnLogs});
    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.verdict->high_risk);
    EXPECT_EQ(outcome.verdict->mint, "MintA");
    EXPECT_EQ(outcome.signature, "sig1");
}

TEST(launch_pipeline, unidentified_mint_yields_no_verdict) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.transactions["sig1"] = makeTransaction("Creator111", {{"MintA", "5"}});
    LaunchPipeline pipeline(rpc);

    auto outcome = pipeline.process(LaunchEvent{"sig1", kNoBurnLogs});
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, LaunchError::MintNotIdentified);
    EXPECT_EQ(rpc.account_calls.load(), 0);
}

TEST(launch_pipeline, missing_transaction_is_not_found) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    LaunchPipeline pipeline(rpc);

    auto outcome = pipeline.process(LaunchEvent{"gone", kNoBurnLogs});
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, LaunchError::NotFound);
    EXPECT_EQ(outcome.signature, "gone");
}

TEST(launch_pipeline, transport_error_is_reported_not_thrown) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.transaction_failure = LaunchError::Transport;
    LaunchPipeline pipeline(rpc);

    auto outcome = pipeline.process(LaunchEvent{"sig1", kNoBurnLogs});
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, LaunchError::Transport);
    EXPECT_STREQ(toString(outcome.error), "transport");
}

TEST(risk_evaluator, malformed_account_response_becomes_red_flag) {
    testing_support::silenceLogs();
    FakeRpc rpc;
    rpc.account_malformed = true;
    RiskEvaluator evaluator(rpc);

    auto verdict = evaluator.evaluate(sampleLaunch(), kBurnLogs);
    std::vector<std::string> expected_red = {signs::mint_info_unavailable};
    std::vector<std::string> expected_good = {signs::lp_burned};
    EXPECT_EQ(verdict.red_flags, expected_red);
    EXPECT_EQ(verdict.good_signs, expected_good);
}
