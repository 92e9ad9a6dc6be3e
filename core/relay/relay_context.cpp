/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/relay_context.hpp"

#include <boost/asio/error.hpp>

#include "coro/asio.hpp"

namespace trestle::relay {

  RelayContext::RelayContext(std::shared_ptr<boost::asio::io_context> io)
      : io_{std::move(io)},
        logger_{log::createLogger("RelayContext", "relay")} {
    BOOST_ASSERT(io_ != nullptr);
  }

  void RelayContext::requestShutdown() {
    if (stopping_) {
      return;
    }
    stopping_ = true;
    SL_INFO(logger_, "Shutting down the relay");
    for (auto *timer : sleeping_) {
      timer->cancel();
    }
    auto callbacks = std::move(on_shutdown_);
    for (auto &callback : callbacks) {
      callback();
    }
  }

  void RelayContext::raiseFatal(std::string reason) {
    if (not fatal_reason_) {
      SL_CRITICAL(logger_, "Relay has to stop: {}", reason);
      fatal_reason_ = std::move(reason);
    }
    requestShutdown();
  }

  void RelayContext::onShutdown(std::function<void()> callback) {
    if (stopping_) {
      callback();
      return;
    }
    on_shutdown_.emplace_back(std::move(callback));
  }

  CoroOutcome<void> RelayContext::sleep(
      std::chrono::steady_clock::duration delay) {
    if (stopping_) {
      co_return coroOutcome(
          make_error_code(boost::asio::error::operation_aborted));
    }
    boost::asio::steady_timer timer{*io_};
    sleeping_.emplace(&timer);
    auto slept = co_await coroSleep(timer, delay);
    sleeping_.erase(&timer);
    co_return slept;
  }

}  // namespace trestle::relay
