/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "coro/coro.hpp"
#include "log/logger.hpp"

namespace trestle::relay {

  /**
   * Lifecycle shared by the tasks of one relay engine. Carries the shutdown
   * request and the fatal outcome, and wakes sleeping tasks when either
   * happens. Used from the thread running the io_context only.
   */
  class RelayContext {
   public:
    explicit RelayContext(std::shared_ptr<boost::asio::io_context> io);

    RelayContext(const RelayContext &) = delete;
    RelayContext &operator=(const RelayContext &) = delete;

    boost::asio::io_context &io() {
      return *io_;
    }

    bool running() const {
      return not stopping_;
    }

    /// Asks every task to finish
    void requestShutdown();

    /**
     * Stops the engine with the fatal outcome. The first reason is kept.
     */
    void raiseFatal(std::string reason);

    const std::optional<std::string> &fatalReason() const {
      return fatal_reason_;
    }

    /// Called once when shutdown starts
    void onShutdown(std::function<void()> callback);

    /**
     * Sleeps unless shutdown is requested in between
     * @return operation_aborted on shutdown
     */
    CoroOutcome<void> sleep(std::chrono::steady_clock::duration delay);

   private:
    std::shared_ptr<boost::asio::io_context> io_;
    bool stopping_ = false;
    std::optional<std::string> fatal_reason_;
    std::vector<std::function<void()>> on_shutdown_;
    std::unordered_set<boost::asio::steady_timer *> sleeping_;
    log::Logger logger_;
  };

}  // namespace trestle::relay
