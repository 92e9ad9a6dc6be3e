/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "coro/coro.hpp"

namespace trestle {
  /**
   * Convert `error_code` filled by `redirect_error` to `outcome`.
   */
  inline outcome::result<void> coroOutcome(
      const boost::system::error_code &ec) {
    if (ec) {
      return ec;
    }
    return outcome::success();
  }

  /**
   * Suspend current coroutine for `delay`.
   * Passing `use_awaitable` alone would `throw` on cancellation,
   * so the error is redirected and returned as `outcome`.
   * Fails with `operation_aborted` if the timer is cancelled.
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-reference-coroutine-parameters)
  inline CoroOutcome<void> coroSleep(
      boost::asio::steady_timer &timer,
      std::chrono::steady_clock::duration delay) {
    timer.expires_after(delay);
    boost::system::error_code ec;
    co_await timer.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return coroOutcome(ec);
  }
}  // namespace trestle
