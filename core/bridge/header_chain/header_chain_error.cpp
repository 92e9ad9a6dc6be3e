/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bridge/header_chain/header_chain_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trestle::bridge::header_chain,
                            HeaderChainError,
                            e) {
  using E = trestle::bridge::header_chain::HeaderChainError;
  switch (e) {
    case E::NOT_INITIALIZED:
      return "Header chain is not initialized";
    case E::ALREADY_INITIALIZED:
      return "Header chain is already initialized";
    case E::HALTED:
      return "Header chain is halted";
    case E::OLD_HEADER:
      return "Header is not newer than the best finalized one";
    case E::UNKNOWN_HEADER:
      return "Header is not imported";
    case E::INVALID_AUTHORITY_SET_ID:
      return "Authority set id of the call does not match the current one";
    case E::INVALID_AUTHORITY_SET:
      return "Authority set is empty, has zero weights or repeated ids";
    case E::INVALID_JUSTIFICATION:
      return "Justification does not prove finality of the header";
    case E::UNSUPPORTED_SCHEDULED_CHANGE:
      return "Forced or delayed authority set change is not supported";
    case E::TOO_MANY_AUTHORITIES_IN_SET:
      return "Authority set is larger than allowed";
    case E::HEADER_OVERFLOW_LIMITS:
      return "Header is larger than allowed";
    case E::INVALID_OPERATING_MODE:
      return "Stored operating mode is unknown";
  }
  return "Unknown error (invalid HeaderChainError)";
}
