#include "transaction_resolver.hpp"
#include "detection_config.hpp"
#include "pipeline_error.hpp"
#include <spdlog/spdlog.h>

ResolvedLaunch TransactionResolver::resolve(const std::string& signature) const {
    auto transaction = rpc_.getTransaction(signature);
    if (!transaction) {
        throw PipelineError(LaunchError::NotFound,
                            "No transaction data available for " + signature);
    }
    return extractLaunch(signature, *transaction);
}

ResolvedLaunch TransactionResolver::extractLaunch(const std::string& signature,
                                                  const nlohmann::json& transaction) {
    ResolvedLaunch launch;
    launch.signature = signature;

    try {
        // Fee payer / primary signer comes first
        const auto& account_keys =
            transaction.at("transaction").at("message").at("accountKeys");
        if (!account_keys.is_array() || account_keys.empty()) {
            throw PipelineError(LaunchError::Decode,
                                "Transaction " + signature + " has no account keys");
        }
        const auto& first_key = account_keys.front();
        launch.creator = first_key.is_object() ? first_key.at("pubkey").get<std::string>()
                                               : first_key.get<std::string>();

        const auto meta = transaction.find("meta");
        if (meta != transaction.end() && meta->is_object()) {
            const auto balances = meta->find("postTokenBalances");
            if (balances != meta->end() && balances->is_array()) {
                for (const auto& balance : *balances) {
                    const auto amount = balance.find("uiTokenAmount");
                    if (amount == balance.end() || !amount->contains("amount")) {
                        continue;
                    }
                    const auto& raw = amount->at("amount");
                    if (raw.is_string() &&
                        raw.get<std::string>() == DetectionConfig::initial_supply_amount) {
                        launch.mint = balance.at("mint").get<std::string>();
                        break;
                    }
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw PipelineError(LaunchError::Decode,
                            "Malformed transaction " + signature + ": " + e.what());
    }

    if (launch.mint.empty()) {
        throw PipelineError(LaunchError::MintNotIdentified,
                            "Could not identify mint address for " + signature);
    }

    spdlog::debug("Resolved launch {}: mint={}, creator={}", signature, launch.mint,
                  launch.creator);
    return launch;
}
