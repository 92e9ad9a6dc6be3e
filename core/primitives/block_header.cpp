/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace trestle::primitives {

  void calculateBlockHash(BlockHeader &header, const crypto::Hasher &hasher) {
    auto encoded_header = scale::encode(header).value();
    header.hash_opt.emplace(hasher.blake2b_256(encoded_header));
  }

  void calculateBlockHashes(std::vector<BlockHeader> &headers,
                            const crypto::Hasher &hasher) {
    for (auto &header : headers) {
      if (not header.hash_opt.has_value()) {
        calculateBlockHash(header, hasher);
      }
    }
  }

}  // namespace trestle::primitives
