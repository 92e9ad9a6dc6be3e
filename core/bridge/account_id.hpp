/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

/// Account of a relayer or of another bridge participant on either chain
TRESTLE_BLOB_STRICT_TYPEDEF(trestle::bridge, AccountId, 32);

namespace trestle::bridge {
  using Balance = uint64_t;

  /// Identifier of a chain, like `rlto` or `mlau`
  using ChainId = common::Blob<4>;
}  // namespace trestle::bridge
