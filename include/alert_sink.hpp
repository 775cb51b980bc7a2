#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "detection_result.hpp"

class AlertSink {
public:
    virtual ~AlertSink() = default;
    virtual void emit(const RiskVerdict& verdict) = 0;
};

// Writes the human-readable report through spdlog
class ConsoleAlertSink : public AlertSink {
public:
    void emit(const RiskVerdict& verdict) override;
};

struct ExplorerLinks {
    std::string solscan;
    std::string pump_fun;
    std::string dexscreener;
};

ExplorerLinks explorerLinks(const RiskVerdict& verdict);
std::string formatReport(const RiskVerdict& verdict);
nlohmann::json toJson(const RiskVerdict& verdict);
