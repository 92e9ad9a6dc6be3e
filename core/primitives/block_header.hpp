/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <optional>
#include <vector>

#include <boost/assert.hpp>

#include "common/blob.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"
#include "scale/trestle_scale.hpp"

namespace trestle::primitives {
  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockNumber number{};                 ///< Block number (height)
    BlockHash parent_hash{};              ///< Parent block hash
    common::Hash256 state_root{};         ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};    ///< Hash of included extrinsics
    Digest digest{};                      ///< Chain-specific auxiliary data
    std::optional<BlockHash> hash_opt{};  ///< Block hash if calculated

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root, extrinsics_root, digest)
          == std::tie(rhs.parent_hash,
                      rhs.number,
                      rhs.state_root,
                      rhs.extrinsics_root,
                      rhs.digest);
    }

    bool operator!=(const BlockHeader &rhs) const {
      return !operator==(rhs);
    }

    std::optional<primitives::BlockInfo> parentInfo() const {
      if (number != 0) {
        return primitives::BlockInfo{number - 1, parent_hash};
      }
      return std::nullopt;
    }

    const BlockHash &hash() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be calculated and saved before that");
      return hash_opt.value();
    }

    BlockInfo blockInfo() const {
      return {number, hash()};
    }
  };

  /**
   * @brief outputs object of type BlockHeader to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << scale::CompactInteger(bh.number)
             << bh.state_root << bh.extrinsics_root << bh.digest;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root >> bh.extrinsics_root
        >> bh.digest;
    if (number_compact > std::numeric_limits<BlockNumber>::max()) {
      common::raise(scale::DecodeError::UNEXPECTED_VALUE);
    }
    bh.number = number_compact.convert_to<BlockNumber>();
    bh.hash_opt.reset();
    return s;
  }

  /**
   * Blake2b-256 of the encoded header, stored into `hash_opt`
   */
  void calculateBlockHash(BlockHeader &header, const crypto::Hasher &hasher);

  /**
   * Calculates hashes of all the headers, which don't have one yet
   */
  void calculateBlockHashes(std::vector<BlockHeader> &headers,
                            const crypto::Hasher &hasher);

}  // namespace trestle::primitives
