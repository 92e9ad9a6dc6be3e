/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trestle::relay {

  /// Transport failures of chain clients, fixed by reconnecting
  enum class ClientError : uint8_t {
    CONNECTION_LOST = 1,
    REQUEST_TIMEOUT,
    UNKNOWN_BLOCK,
  };

  /**
   * Failures which require a reconnect. Any other error of a submission
   * means the chain rejected the work, usually because another relayer has
   * already done it.
   */
  bool isConnectionError(const std::error_code &ec);

}  // namespace trestle::relay

OUTCOME_HPP_DECLARE_ERROR(trestle::relay, ClientError);
