#include "alert_sink.hpp"
#include <gtest/gtest.h>

namespace {

RiskVerdict sampleVerdict(bool risky) {
    RiskVerdict verdict;
    verdict.signature = std::string(88, 'S');
    verdict.mint = "MintA";
    verdict.creator = "Creator111";
    verdict.good_signs = {"Freeze authority REVOKED (cannot freeze holders' tokens)"};
    if (risky) {
        verdict.red_flags = {"LP tokens NOT burned (high risk - dev can pull liquidity)"};
    }
    verdict.high_risk = risky;
    return verdict;
}

} // namespace

TEST(explorer_links, use_fixed_templates) {
    auto links = explorerLinks(sampleVerdict(true));
    EXPECT_EQ(links.solscan, "https://solscan.io/tx/" + std::string(88, 'S'));
    EXPECT_EQ(links.pump_fun, "https://pump.fun/" + std::string(44, 'S'));
    EXPECT_EQ(links.dexscreener, "https://dexscreener.com/solana/MintA");
}

TEST(explorer_links, short_signature_is_not_padded) {
    auto verdict = sampleVerdict(false);
    verdict.signature = "abc";
    EXPECT_EQ(explorerLinks(verdict).pump_fun, "https://pump.fun/abc");
}

TEST(report, lists_signs_then_flags_then_label) {
    auto report = formatReport(sampleVerdict(true));

    auto mint_pos = report.find("Token Mint: MintA");
    auto good_pos = report.find("GOOD SIGNS:");
    auto freeze_pos = report.find("Freeze authority REVOKED");
    auto red_pos = report.find("RED FLAGS:");
    auto lp_pos = report.find("LP tokens NOT burned");
    auto label_pos = report.find("HIGH RISK - POSSIBLE RUG");

    ASSERT_NE(mint_pos, std::string::npos);
    ASSERT_NE(label_pos, std::string::npos);
    EXPECT_LT(mint_pos, good_pos);
    EXPECT_LT(good_pos, freeze_pos);
    EXPECT_LT(freeze_pos, red_pos);
    EXPECT_LT(red_pos, lp_pos);
    EXPECT_LT(lp_pos, label_pos);
    EXPECT_NE(report.find("Creator: Creator111"), std::string::npos);
    EXPECT_NE(report.find("https://dexscreener.com/solana/MintA"), std::string::npos);
}

TEST(report, safer_token_without_red_flags) {
    auto report = formatReport(sampleVerdict(false));
    EXPECT_NE(report.find("None detected so far"), std::string::npos);
    EXPECT_NE(report.find("SAFER TOKEN (but always DYOR!)"), std::string::npos);
    EXPECT_EQ(report.find("HIGH RISK"), std::string::npos);
}

TEST(verdict_json, carries_lists_in_order) {
    auto verdict = sampleVerdict(true);
    verdict.red_flags.insert(verdict.red_flags.begin(), "Mint authority ACTIVE: Dev1");
    auto json = toJson(verdict);

    EXPECT_EQ(json["mint"], "MintA");
    EXPECT_EQ(json["creator"], "Creator111");
    EXPECT_EQ(json["high_risk"], true);
    ASSERT_EQ(json["red_flags"].size(), 2u);
    EXPECT_EQ(json["red_flags"][0], "Mint authority ACTIVE: Dev1");
    EXPECT_EQ(json["links"]["dexscreener"], "https://dexscreener.com/solana/MintA");
}
