#pragma once
#include <chrono>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>

// Resolves host:port on the current coroutine's executor. Fails with
// beast::error::timeout once `deadline` passes.
inline boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type>
resolveBefore(const std::string &host, const std::string &port,
              std::chrono::steady_clock::time_point deadline) {
  namespace net = boost::asio;
  auto executor = co_await net::this_coro::executor;

  net::ip::tcp::resolver resolver(executor);
  net::steady_timer timer(executor);
  timer.expires_at(deadline);
  bool expired = false;
  timer.async_wait([&resolver, &expired](boost::system::error_code ec) {
    if (!ec) {
      expired = true;
      resolver.cancel();
    }
  });

  boost::system::error_code ec;
  auto results = co_await resolver.async_resolve(
      host, port, net::redirect_error(net::use_awaitable, ec));
  timer.cancel();

  if (expired) {
    throw boost::system::system_error(boost::beast::error::timeout);
  }
  if (ec) {
    throw boost::system::system_error(ec);
  }
  co_return results;
}
