/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/client_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::relay, ClientError, e) {
  using E = trestle::relay::ClientError;
  switch (e) {
    case E::CONNECTION_LOST:
      return "Connection to the chain is lost";
    case E::REQUEST_TIMEOUT:
      return "Chain did not answer in time";
    case E::UNKNOWN_BLOCK:
      return "Block is not known to the chain node";
  }
  return "Unknown error (invalid ClientError)";
}

namespace trestle::relay {

  bool isConnectionError(const std::error_code &ec) {
    return ec == ClientError::CONNECTION_LOST
        or ec == ClientError::REQUEST_TIMEOUT;
  }

}  // namespace trestle::relay
