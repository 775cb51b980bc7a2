#include "solana_rpc_client.hpp"
#include "detection_config.hpp"
#include "encoding.hpp"
#include "pipeline_error.hpp"
#include "resolve_deadline.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

Endpoint Endpoint::parse(const std::string& url) {
    Endpoint endpoint;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https" || scheme == "wss") {
        endpoint.tls = true;
    } else if (scheme == "http" || scheme == "ws") {
        endpoint.tls = false;
    } else {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    std::string rest = url.substr(scheme_end + 3);
    auto slash_pos = rest.find('/');
    std::string authority = rest.substr(0, slash_pos);
    endpoint.target = slash_pos == std::string::npos ? "/" : rest.substr(slash_pos);

    auto colon_pos = authority.rfind(':');
    if (colon_pos != std::string::npos) {
        endpoint.host = authority.substr(0, colon_pos);
        endpoint.port = authority.substr(colon_pos + 1);
    } else {
        endpoint.host = authority;
        endpoint.port = endpoint.tls ? "443" : "80";
    }

    if (endpoint.host.empty() || endpoint.port.empty()) {
        throw std::invalid_argument("URL is missing host or port: " + url);
    }
    return endpoint;
}

class SolanaRpcClient::Impl {
public:
    Impl(const std::string& rpc_url, std::chrono::milliseconds timeout)
        : endpoint_(Endpoint::parse(rpc_url)), timeout_(timeout),
          ssl_ctx_(ssl::context::tls_client) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);

        spdlog::info("Solana RPC client configured for host: {}, path: {}",
                     endpoint_.host, endpoint_.target);
    }

    std::optional<nlohmann::json> getTransaction(const std::string& signature) {
        nlohmann::json options = {
            {"encoding", "jsonParsed"},
            {"maxSupportedTransactionVersion", 0},
            {"commitment", std::string(DetectionConfig::commitment)}
        };

        auto result = call("getTransaction", nlohmann::json::array({signature, options}));
        if (result.is_null()) {
            return std::nullopt;
        }
        return result;
    }

    std::optional<std::vector<uint8_t>> getAccountData(const std::string& address) {
        nlohmann::json options = {
            {"encoding", "base64"},
            {"commitment", std::string(DetectionConfig::commitment)}
        };

        auto result = call("getAccountInfo", nlohmann::json::array({address, options}));
        try {
            const auto& value = result.at("value");
            if (value.is_null()) {
                return std::nullopt;
            }

            // "data": ["<base64>", "base64"]
            auto encoded = value.at("data").at(0).get<std::string>();
            auto bytes = base64Decode(encoded);
            if (!bytes) {
                throw PipelineError(LaunchError::Decode,
                                    "Account data for " + address + " is not valid base64");
            }
            return bytes;
        } catch (const nlohmann::json::exception& e) {
            throw PipelineError(LaunchError::Decode,
                                fmt::format("Malformed getAccountInfo result: {}", e.what()));
        }
    }

private:
    nlohmann::json call(const std::string& method, nlohmann::json params) {
        nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", next_id_++},
            {"method", method},
            {"params", std::move(params)}
        };

        std::string body = post(request.dump());

        nlohmann::json response;
        try {
            response = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            throw PipelineError(LaunchError::Decode,
                                fmt::format("{} returned invalid JSON: {}", method, e.what()));
        }

        if (response.contains("error")) {
            const auto& error = response["error"];
            int code = 0;
            std::string message = error.dump();
            if (error.is_object()) {
                auto code_it = error.find("code");
                if (code_it != error.end() && code_it->is_number_integer()) {
                    code = code_it->get<int>();
                }
                auto message_it = error.find("message");
                if (message_it != error.end() && message_it->is_string()) {
                    message = message_it->get<std::string>();
                }
            }
            spdlog::debug("Solana RPC error from {}: {} ({})", method, message, code);

            // Invalid params: malformed or unknown signature/address
            if (code == -32602) {
                throw PipelineError(LaunchError::NotFound,
                                    fmt::format("{} rejected: {}", method, message));
            }
            throw PipelineError(LaunchError::Transport,
                                fmt::format("{} failed: {} ({})", method, message, code));
        }

        if (!response.contains("result")) {
            throw PipelineError(LaunchError::Decode, method + " response has no result");
        }
        return std::move(response["result"]);
    }

    // One connection per call; resolve, connect and exchange share one deadline
    std::string post(const std::string& body) {
        net::io_context ioc;
        std::string response_body;
        std::exception_ptr failure;

        net::co_spawn(ioc, exchange(body),
                      [&](std::exception_ptr e, std::string result) {
                          failure = e;
                          response_body = std::move(result);
                      });
        ioc.run();

        if (failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const boost::system::system_error& e) {
                if (e.code() == beast::error::timeout) {
                    throw PipelineError(LaunchError::Timeout,
                                        fmt::format("RPC request to {} timed out after {}ms",
                                                    endpoint_.host, timeout_.count()));
                }
                throw PipelineError(LaunchError::Transport,
                                    fmt::format("RPC request to {} failed: {}",
                                                endpoint_.host, e.code().message()));
            }
        }
        return response_body;
    }

    net::awaitable<std::string> exchange(std::string body) {
        auto executor = co_await net::this_coro::executor;
        const auto deadline = std::chrono::steady_clock::now() + timeout_;

        http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
        req.prepare_payload();

        auto results = co_await resolveBefore(endpoint_.host, endpoint_.port, deadline);

        http::response<http::string_body> res;
        if (endpoint_.tls) {
            beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
                throw boost::system::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()),
                                      net::error::get_ssl_category()));
            }

            beast::get_lowest_layer(stream).expires_at(deadline);
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            res = co_await roundTrip(stream, req);

            // Peers often drop the connection without close_notify
            beast::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } else {
            beast::tcp_stream stream(executor);
            stream.expires_at(deadline);
            co_await stream.async_connect(results, net::use_awaitable);
            res = co_await roundTrip(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        if (res.result() != http::status::ok) {
            throw PipelineError(LaunchError::Transport,
                                fmt::format("Solana RPC call failed with status: {}",
                                            res.result_int()));
        }
        co_return std::move(res.body());
    }

    template <class Stream>
    static net::awaitable<http::response<http::string_body>>
    roundTrip(Stream& stream, const http::request<http::string_body>& req) {
        co_await http::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        co_return res;
    }

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    ssl::context ssl_ctx_;
    std::atomic<uint64_t> next_id_{1};
};

// Public interface implementation
SolanaRpcClient::SolanaRpcClient(const std::string& rpc_url, std::chrono::milliseconds timeout)
    : pImpl_(std::make_unique<Impl>(rpc_url, timeout)) {}

SolanaRpcClient::~SolanaRpcClient() = default;

std::optional<nlohmann::json> SolanaRpcClient::getTransaction(const std::string& signature) {
    return pImpl_->getTransaction(signature);
}

std::optional<std::vector<uint8_t>> SolanaRpcClient::getAccountData(const std::string& address) {
    return pImpl_->getAccountData(address);
}
