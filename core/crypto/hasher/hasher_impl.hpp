/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace trestle::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash128 blake2b_128(common::BufferView data) const override;

    Hash256 blake2b_256(common::BufferView data) const override;
  };

}  // namespace trestle::crypto
