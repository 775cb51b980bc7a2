#include "log_subscription.hpp"
#include "detection_config.hpp"
#include "resolve_deadline.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace {

using PlainSocket = websocket::stream<beast::tcp_stream>;
using TlsSocket = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

constexpr int kSubscribeRequestId = 1;

} // namespace

std::string makeLogsSubscribeRequest(const std::string& program_id, int request_id) {
    nlohmann::json filter = {{"mentions", nlohmann::json::array({program_id})}};
    nlohmann::json options = {{"commitment", std::string(DetectionConfig::commitment)}};

    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", request_id},
        {"method", "logsSubscribe"}
    };
    request["params"] = nlohmann::json::array({filter, options});
    return request.dump();
}

std::optional<LaunchEvent> parseLogsNotification(const std::string& payload) {
    auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return std::nullopt;
    }

    try {
        auto method = message.find("method");
        if (method == message.end() || *method != "logsNotification") {
            return std::nullopt;
        }

        const auto& value = message.at("params").at("result").at("value");
        LaunchEvent event;
        event.signature = value.at("signature").get<std::string>();

        const auto& logs = value.at("logs");
        if (logs.is_array()) {
            event.log_lines.reserve(logs.size());
            for (const auto& line : logs) {
                if (line.is_string()) {
                    event.log_lines.push_back(line.get<std::string>());
                }
            }
        }
        return event;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Ignoring malformed logsNotification: {}", e.what());
        return std::nullopt;
    }
}

// Everything here runs on the reader thread's io_context
struct LogSubscription::Session {
    explicit Session(LogSubscription& owner)
        : owner_(owner), ssl_ctx_(ssl::context::tls_client), backoff_timer_(ioc_) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    net::awaitable<void> run(std::promise<void> first_connect) {
        bool connected_once = false;
        auto delay = DetectionConfig::reconnect_base_delay;
        const auto request = makeLogsSubscribeRequest(owner_.program_id_, kSubscribeRequestId);

        auto on_subscribed = [&] {
            delay = DetectionConfig::reconnect_base_delay;
            if (!connected_once) {
                connected_once = true;
                first_connect.set_value();
            } else {
                owner_.reconnects_.fetch_add(1);
                spdlog::info("Log subscription re-established");
            }
        };

        while (!owner_.closed_.load()) {
            std::string failure;
            try {
                auto executor = co_await net::this_coro::executor;
                if (owner_.endpoint_.tls) {
                    TlsSocket ws(executor, ssl_ctx_);
                    co_await connect(ws);
                    co_await serve(ws, request, on_subscribed);
                } else {
                    PlainSocket ws(executor);
                    co_await connect(ws);
                    co_await serve(ws, request, on_subscribed);
                }
            } catch (const boost::system::system_error& e) {
                failure = e.code().message();
            } catch (const std::exception& e) {
                failure = e.what();
            }
            close_socket_ = nullptr;

            if (owner_.closed_.load()) {
                break;
            }
            if (!connected_once) {
                first_connect.set_exception(std::make_exception_ptr(
                    std::runtime_error("Failed to subscribe to program logs: " + failure)));
                co_return;
            }

            spdlog::warn("Log subscription dropped ({}), reconnecting in {}ms", failure,
                         delay.count());
            beast::error_code ec;
            backoff_timer_.expires_after(delay);
            co_await backoff_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
            delay = std::min(delay * 2, DetectionConfig::reconnect_max_delay);
        }
    }

    void requestClose() {
        if (close_socket_) {
            close_socket_();
        }
        backoff_timer_.cancel();
    }

    net::io_context ioc_;

private:
    net::awaitable<void> connect(PlainSocket& ws) {
        const auto deadline = std::chrono::steady_clock::now() + owner_.connect_timeout_;
        const auto& endpoint = owner_.endpoint_;
        auto results = co_await resolveBefore(endpoint.host, endpoint.port, deadline);
        auto& stream = beast::get_lowest_layer(ws);
        stream.expires_at(deadline);
        co_await stream.async_connect(results, net::use_awaitable);
        stream.expires_never();
        co_await handshake(ws);
    }

    net::awaitable<void> connect(TlsSocket& ws) {
        const auto& endpoint = owner_.endpoint_;
        if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name " + endpoint.host);
        }

        const auto deadline = std::chrono::steady_clock::now() + owner_.connect_timeout_;
        auto results = co_await resolveBefore(endpoint.host, endpoint.port, deadline);
        auto& stream = beast::get_lowest_layer(ws);
        stream.expires_at(deadline);
        co_await stream.async_connect(results, net::use_awaitable);
        co_await ws.next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
        stream.expires_never();
        co_await handshake(ws);
    }

    template <class Socket>
    net::awaitable<void> handshake(Socket& ws) {
        const auto& endpoint = owner_.endpoint_;
        // Client defaults never time out an idle read; ping and give up instead
        auto options = websocket::stream_base::timeout::suggested(beast::role_type::client);
        options.idle_timeout = owner_.idle_timeout_;
        options.keep_alive_pings = true;
        ws.set_option(options);
        co_await ws.async_handshake(endpoint.host + ":" + endpoint.port, endpoint.target,
                                    net::use_awaitable);
    }

    template <class Socket, class OnSubscribed>
    net::awaitable<void> serve(Socket& ws, const std::string& request, OnSubscribed& on_subscribed) {
        close_socket_ = [&ws] {
            ws.async_close(websocket::close_code::normal, [](beast::error_code) {});
        };

        co_await ws.async_write(net::buffer(request), net::use_awaitable);

        bool subscribed = false;
        beast::flat_buffer buffer;
        for (;;) {
            co_await ws.async_read(buffer, net::use_awaitable);
            auto payload = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());

            if (!subscribed) {
                auto reply = nlohmann::json::parse(payload, nullptr, false);
                if (!reply.is_discarded() && reply.is_object() && reply.contains("id") &&
                    reply["id"] == kSubscribeRequestId) {
                    if (reply.contains("error")) {
                        throw std::runtime_error("logsSubscribe rejected: " +
                                                 reply["error"].dump());
                    }
                    subscribed = true;
                    spdlog::info("Subscribed to logs mentioning {} (subscription {})",
                                 owner_.program_id_, reply.value("result", nlohmann::json()).dump());
                    on_subscribed();
                    continue;
                }
            }

            if (auto event = parseLogsNotification(payload)) {
                owner_.push(std::move(*event));
            }
        }
    }

    LogSubscription& owner_;
    ssl::context ssl_ctx_;
    net::steady_timer backoff_timer_;
    std::function<void()> close_socket_;
};

LogSubscription::LogSubscription(const std::string& ws_url, std::string program_id,
                                 size_t max_pending)
    : endpoint_(Endpoint::parse(ws_url)), program_id_(std::move(program_id)),
      max_pending_(max_pending == 0 ? 1 : max_pending) {}

LogSubscription::~LogSubscription() {
    close();
}

void LogSubscription::start(std::chrono::milliseconds connect_timeout,
                            std::chrono::milliseconds idle_timeout) {
    if (session_) {
        throw std::logic_error("LogSubscription already started");
    }
    connect_timeout_ = connect_timeout;
    idle_timeout_ = idle_timeout;
    session_ = std::make_unique<Session>(*this);

    std::promise<void> first_connect;
    auto connected = first_connect.get_future();
    std::promise<void> done;
    reader_done_ = done.get_future();

    spdlog::info("Connecting to {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.target);
    reader_ = std::thread([this, first_connect = std::move(first_connect),
                           done = std::move(done)]() mutable {
        readerLoop(std::move(first_connect));
        done.set_value();
    });

    // TCP connect, TLS and websocket handshakes, subscribe reply
    if (connected.wait_for(connect_timeout * 4) == std::future_status::timeout) {
        close();
        throw std::runtime_error("Timed out subscribing to program logs");
    }
    try {
        connected.get();
    } catch (const std::exception&) {
        close();
        throw;
    }
}

void LogSubscription::readerLoop(std::promise<void> first_connect) {
    net::co_spawn(session_->ioc_, session_->run(std::move(first_connect)),
                  [](std::exception_ptr e) {
                      if (!e) {
                          return;
                      }
                      try {
                          std::rethrow_exception(e);
                      } catch (const std::exception& ex) {
                          spdlog::error("Log subscription reader stopped: {}", ex.what());
                      }
                  });
    session_->ioc_.run();

    // Unblock consumers waiting in next()
    closed_.store(true);
    queue_cv_.notify_all();
}

void LogSubscription::push(LaunchEvent event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (pending_.size() >= max_pending_) {
            dropped_.fetch_add(1);
            spdlog::warn("Log feed backlog full ({} buffered), dropping {}", max_pending_,
                         pending_.front().signature);
            pending_.pop_front();
        }
        pending_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

bool LogSubscription::next(LaunchEvent& event, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, wait, [this] { return !pending_.empty() || closed_.load(); });
    if (closed_.load() || pending_.empty()) {
        return false;
    }
    event = std::move(pending_.front());
    pending_.pop_front();
    return true;
}

void LogSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_.store(true);
        pending_.clear();
    }
    queue_cv_.notify_all();

    if (!session_) {
        return;
    }

    if (reader_.joinable()) {
        net::post(session_->ioc_, [session = session_.get()] { session->requestClose(); });

        // Give the close handshake a moment, then stop the loop outright
        if (reader_done_.valid() &&
            reader_done_.wait_for(std::chrono::seconds(2)) == std::future_status::timeout) {
            session_->ioc_.stop();
        }
        reader_.join();
        spdlog::info("Log subscription closed");
    }
}
