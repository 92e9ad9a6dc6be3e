/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "primitives/common.hpp"
#include "storage/state_proof/state_proof.hpp"

namespace trestle::bridge::parachains {

  using primitives::BlockInfo;
  using primitives::BlockNumber;

  using ParaId = uint32_t;
  /// Encoded header of a parachain
  using ParaHead = common::Buffer;
  /// blake2b_256 of the para head
  using ParaHash = common::Hash256;

  struct BestParaHeadHash {
    /// Number of the relay block, at which the head was read
    BlockNumber at_relay_block_number{};
    ParaHash head_hash;

    bool operator==(const BestParaHeadHash &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BestParaHeadHash &v) {
    return s << v.at_relay_block_number << v.head_hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BestParaHeadHash &v) {
    return s >> v.at_relay_block_number >> v.head_hash;
  }

  /// Known best head of a parachain
  struct ParaInfo {
    BestParaHeadHash best_head_hash;
    /// Position in the ring buffer of imported heads, used by the next head
    uint32_t next_imported_hash_position = 0;

    bool operator==(const ParaInfo &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ParaInfo &v) {
    return s << v.best_head_hash << v.next_imported_hash_position;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ParaInfo &v) {
    return s >> v.best_head_hash >> v.next_imported_hash_position;
  }

  /// Key of an imported head, or of a position in the imported hashes
  template <typename T>
  struct ParaKey {
    ParaId para_id{};
    T value{};

    bool operator==(const ParaKey &rhs) const = default;
  };

  template <class Stream,
            typename T,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ParaKey<T> &v) {
    return s << v.para_id << v.value;
  }

  template <class Stream,
            typename T,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ParaKey<T> &v) {
    return s >> v.para_id >> v.value;
  }

  struct ParaHeadUpdate {
    ParaId para_id{};
    ParaHash head_hash;

    bool operator==(const ParaHeadUpdate &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ParaHeadUpdate &v) {
    return s << v.para_id << v.head_hash;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ParaHeadUpdate &v) {
    return s >> v.para_id >> v.head_hash;
  }

  /// Call updating heads of parachains, read at a relay chain block
  struct SubmitParachainHeadsCall {
    BlockInfo at_relay_block;
    std::vector<ParaHeadUpdate> parachains;
    storage::StateProof heads_proof;
  };

  struct ParachainsConfig {
    /// Size of the imported heads ring buffer of every parachain
    uint32_t heads_to_keep = 64;
    uint32_t max_para_head_data_size = 1024;
  };

  /// Outcome of a heads submission
  struct SubmitParachainHeadsInfo {
    size_t accepted = 0;
    size_t skipped = 0;
  };

}  // namespace trestle::bridge::parachains
