#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "launch_event.hpp"
#include "solana_rpc_client.hpp"

class TransactionResolver {
public:
    explicit TransactionResolver(SolanaRpc& rpc) : rpc_(rpc) {}

    // Throws PipelineError(NotFound | MintNotIdentified | Decode | Transport | Timeout)
    ResolvedLaunch resolve(const std::string& signature) const;

    // Pulls creator and mint out of a jsonParsed getTransaction result.
    // The mint is the first post-balance holding exactly the initial supply.
    static ResolvedLaunch extractLaunch(const std::string& signature,
                                        const nlohmann::json& transaction);

private:
    SolanaRpc& rpc_;
};
