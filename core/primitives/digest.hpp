/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>
#include <vector>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/outcome_throw.hpp"
#include "scale/trestle_scale.hpp"

namespace trestle::primitives {

  /// Consensus engine unique ID
  using ConsensusEngineId = common::Blob<4>;

  inline const ConsensusEngineId kGrandpaEngineId{
      std::array<uint8_t, 4>{'F', 'R', 'N', 'K'}};

  namespace detail {
    struct DigestItemCommon {
      ConsensusEngineId consensus_engine_id;
      common::Buffer data;

      bool operator==(const DigestItemCommon &rhs) const = default;
    };
  }  // namespace detail

  /// A pre-runtime digest, produced by the block author
  struct PreRuntime : public detail::DigestItemCommon {};

  /// A message from the runtime to the consensus engine
  struct Consensus : public detail::DigestItemCommon {};

  /// Put a Seal on it
  struct Seal : public detail::DigestItemCommon {};

  /// Some other thing. Unsupported and experimental.
  struct Other {
    common::Buffer data;

    bool operator==(const Other &rhs) const = default;
  };

  /// Runtime code or heap pages updated
  struct RuntimeEnvironmentUpdated {
    bool operator==(const RuntimeEnvironmentUpdated &) const = default;
  };

  /**
   * Digest item that is able to encode/decode 'system' digest items and
   * provide opaque access to other items. Encoded with the indices
   * Other = 0, Consensus = 4, Seal = 5, PreRuntime = 6,
   * RuntimeEnvironmentUpdated = 8.
   */
  struct DigestItem {
    std::variant<Other,
                 Consensus,
                 Seal,
                 PreRuntime,
                 RuntimeEnvironmentUpdated>
        value;

    bool operator==(const DigestItem &rhs) const = default;
  };

  /// Chain-specific auxiliary data of a block header
  using Digest = std::vector<DigestItem>;

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DigestItem &item) {
    std::visit(
        [&s](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, Other>) {
            s << uint8_t{0} << v.data;
          } else if constexpr (std::is_same_v<T, Consensus>) {
            s << uint8_t{4} << v.consensus_engine_id << v.data;
          } else if constexpr (std::is_same_v<T, Seal>) {
            s << uint8_t{5} << v.consensus_engine_id << v.data;
          } else if constexpr (std::is_same_v<T, PreRuntime>) {
            s << uint8_t{6} << v.consensus_engine_id << v.data;
          } else {
            s << uint8_t{8};
          }
        },
        item.value);
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DigestItem &item) {
    uint8_t index = 0;
    s >> index;
    switch (index) {
      case 0: {
        Other v;
        s >> v.data;
        item.value = std::move(v);
        break;
      }
      case 4: {
        Consensus v;
        s >> v.consensus_engine_id >> v.data;
        item.value = std::move(v);
        break;
      }
      case 5: {
        Seal v;
        s >> v.consensus_engine_id >> v.data;
        item.value = std::move(v);
        break;
      }
      case 6: {
        PreRuntime v;
        s >> v.consensus_engine_id >> v.data;
        item.value = std::move(v);
        break;
      }
      case 8:
        item.value = RuntimeEnvironmentUpdated{};
        break;
      default:
        common::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
    return s;
  }

}  // namespace trestle::primitives
