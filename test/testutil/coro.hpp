/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <boost/asio/io_context.hpp>

#include "coro/spawn.hpp"

namespace testutil {

  /**
   * Runs the coroutine to completion on a fresh io_context
   */
  template <typename T>
  T runCoro(trestle::Coro<T> coro) {
    boost::asio::io_context io;
    std::optional<T> result;
    trestle::coroSpawn(
        io.get_executor(),
        [&result, coro{std::move(coro)}]() mutable -> trestle::Coro<void> {
          result.emplace(co_await std::move(coro));
        });
    io.run();
    return std::move(result.value());
  }

}  // namespace testutil
