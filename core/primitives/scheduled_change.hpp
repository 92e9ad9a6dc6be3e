/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>

#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"

namespace trestle::primitives {

  /// Authority set change, enacted after `subchain_length` blocks
  struct ScheduledChange {
    AuthorityList authorities;
    BlockNumber subchain_length = 0;

    bool operator==(const ScheduledChange &rhs) const = default;
  };

  /// Authority set change, enacted without finality of the signalling block
  struct ForcedChange {
    BlockNumber delay_start = 0;
    AuthorityList authorities;
    BlockNumber subchain_length = 0;

    bool operator==(const ForcedChange &rhs) const = default;
  };

  struct OnDisabled {
    AuthorityIndex authority_index = 0;

    bool operator==(const OnDisabled &rhs) const = default;
  };

  struct Pause {
    BlockNumber subchain_length = 0;

    bool operator==(const Pause &rhs) const = default;
  };

  struct Resume {
    BlockNumber subchain_length = 0;

    bool operator==(const Resume &rhs) const = default;
  };

  /**
   * GRANDPA consensus log, carried in `Consensus` digest items with the
   * `FRNK` engine id. Encoded with indices 1 to 5 in declaration order.
   */
  struct GrandpaConsensusLog {
    std::variant<ScheduledChange, ForcedChange, OnDisabled, Pause, Resume>
        value;

    bool operator==(const GrandpaConsensusLog &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const GrandpaConsensusLog &log) {
    s << static_cast<uint8_t>(log.value.index() + 1);
    std::visit(
        [&s](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, ScheduledChange>) {
            s << v.authorities << v.subchain_length;
          } else if constexpr (std::is_same_v<T, ForcedChange>) {
            s << v.delay_start << v.authorities << v.subchain_length;
          } else if constexpr (std::is_same_v<T, OnDisabled>) {
            s << v.authority_index;
          } else {
            s << v.subchain_length;
          }
        },
        log.value);
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, GrandpaConsensusLog &log) {
    uint8_t index = 0;
    s >> index;
    switch (index) {
      case 1: {
        ScheduledChange v;
        s >> v.authorities >> v.subchain_length;
        log.value = std::move(v);
        break;
      }
      case 2: {
        ForcedChange v;
        s >> v.delay_start >> v.authorities >> v.subchain_length;
        log.value = std::move(v);
        break;
      }
      case 3: {
        OnDisabled v;
        s >> v.authority_index;
        log.value = v;
        break;
      }
      case 4: {
        Pause v;
        s >> v.subchain_length;
        log.value = v;
        break;
      }
      case 5: {
        Resume v;
        s >> v.subchain_length;
        log.value = v;
        break;
      }
      default:
        common::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
    return s;
  }

  /**
   * Wraps the log into a digest item of the GRANDPA engine
   */
  outcome::result<DigestItem> makeGrandpaDigest(const GrandpaConsensusLog &log);

  /**
   * First GRANDPA scheduled change of the header, undecodable logs of the
   * engine are not considered
   */
  std::optional<ScheduledChange> findScheduledChange(const BlockHeader &header);

  /**
   * First GRANDPA forced change of the header
   */
  std::optional<ForcedChange> findForcedChange(const BlockHeader &header);

}  // namespace trestle::primitives
