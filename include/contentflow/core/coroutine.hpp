#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>

namespace contentflow {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Suspend the calling coroutine for `duration` on its own executor.
/// Returns false when the wait was cancelled.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<bool> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  timer.expires_after(
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(
          duration));
  boost::system::error_code ec;
  co_await timer.async_wait(
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  co_return !ec;
}

} // namespace contentflow
