#pragma once
#include "detection_result.hpp"
#include "launch_event.hpp"
#include "risk_evaluator.hpp"
#include "solana_rpc_client.hpp"
#include "transaction_resolver.hpp"

// resolve -> evaluate for one launch. Never throws: every failure is folded
// into the returned outcome so the caller can keep consuming the feed.
class LaunchPipeline {
public:
    explicit LaunchPipeline(SolanaRpc& rpc) : resolver_(rpc), evaluator_(rpc) {}

    LaunchOutcome process(const LaunchEvent& event) const;

private:
    TransactionResolver resolver_;
    RiskEvaluator evaluator_;
};
