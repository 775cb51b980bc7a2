#include "alert_sink.hpp"
#include "detection_config.hpp"
#include <fmt/format.h>
#include <iterator>
#include <spdlog/spdlog.h>

ExplorerLinks explorerLinks(const RiskVerdict& verdict) {
    ExplorerLinks links;
    links.solscan = "https://solscan.io/tx/" + verdict.signature;
    // Approximate: pump.fun pages are keyed by mint, the signature prefix is a best guess
    links.pump_fun = "https://pump.fun/" +
                     verdict.signature.substr(0, DetectionConfig::pump_fun_link_length);
    links.dexscreener = "https://dexscreener.com/solana/" + verdict.mint;
    return links;
}

std::string formatReport(const RiskVerdict& verdict) {
    auto links = explorerLinks(verdict);

    std::string report;
    auto out = std::back_inserter(report);
    fmt::format_to(out, "NEW PUMP.FUN LAUNCH DETECTED!\n");
    fmt::format_to(out, "Transaction: {}\n", links.solscan);
    fmt::format_to(out, "Pump.fun: {}\n", links.pump_fun);
    fmt::format_to(out, "Token Mint: {}\n", verdict.mint);
    fmt::format_to(out, "Creator: {}\n", verdict.creator);
    fmt::format_to(out, "Dexscreener: {}\n", links.dexscreener);

    fmt::format_to(out, "GOOD SIGNS:\n");
    for (const auto& sign : verdict.good_signs) {
        fmt::format_to(out, "   {}\n", sign);
    }

    fmt::format_to(out, "RED FLAGS:\n");
    if (verdict.red_flags.empty()) {
        fmt::format_to(out, "   None detected so far\n");
    }
    for (const auto& flag : verdict.red_flags) {
        fmt::format_to(out, "   {}\n", flag);
    }

    fmt::format_to(out, "{}", verdict.high_risk ? "HIGH RISK - POSSIBLE RUG"
                                                : "SAFER TOKEN (but always DYOR!)");
    return report;
}

nlohmann::json toJson(const RiskVerdict& verdict) {
    auto links = explorerLinks(verdict);
    return {
        {"signature", verdict.signature},
        {"mint", verdict.mint},
        {"creator", verdict.creator},
        {"good_signs", verdict.good_signs},
        {"red_flags", verdict.red_flags},
        {"high_risk", verdict.high_risk},
        {"links", {
            {"solscan", links.solscan},
            {"pump_fun", links.pump_fun},
            {"dexscreener", links.dexscreener}
        }}
    };
}

void ConsoleAlertSink::emit(const RiskVerdict& verdict) {
    if (verdict.high_risk) {
        spdlog::warn("\n{}\n{}", formatReport(verdict), std::string(80, '='));
    } else {
        spdlog::info("\n{}\n{}", formatReport(verdict), std::string(80, '='));
    }
}
