/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <chrono>

namespace trestle::relay {

  /**
   * Delays between reconnection attempts, doubling up to the limit
   */
  class ExponentialBackoff {
   public:
    using Duration = std::chrono::milliseconds;

    ExponentialBackoff(Duration initial, Duration max)
        : initial_{initial}, max_{std::max(initial, max)}, next_{initial} {}

    /// Delay before the next attempt
    Duration next() {
      auto current = next_;
      next_ = std::min(max_, next_ * 2);
      return current;
    }

    void reset() {
      next_ = initial_;
    }

   private:
    Duration initial_;
    Duration max_;
    Duration next_;
  };

}  // namespace trestle::relay
