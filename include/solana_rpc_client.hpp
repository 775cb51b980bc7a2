#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Read-only view of the ledger used by the resolver and the evaluator.
// Implementations throw PipelineError (Transport, Timeout, NotFound, Decode).
class SolanaRpc {
public:
    virtual ~SolanaRpc() = default;

    // Parsed transaction ("result" object) or nullopt when the node has none
    virtual std::optional<nlohmann::json> getTransaction(const std::string& signature) = 0;

    // Raw account data or nullopt when the account does not exist
    virtual std::optional<std::vector<uint8_t>> getAccountData(const std::string& address) = 0;
};

class SolanaRpcClient : public SolanaRpc {
public:
    SolanaRpcClient(const std::string& rpc_url, std::chrono::milliseconds timeout);
    ~SolanaRpcClient() override;

    std::optional<nlohmann::json> getTransaction(const std::string& signature) override;
    std::optional<std::vector<uint8_t>> getAccountData(const std::string& address) override;

    // Non-copyable
    SolanaRpcClient(const SolanaRpcClient&) = delete;
    SolanaRpcClient& operator=(const SolanaRpcClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Splits http(s)/ws(s) URLs into their parts; throws std::invalid_argument
struct Endpoint {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target;

    static Endpoint parse(const std::string& url);
};
