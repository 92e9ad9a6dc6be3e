/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/outcome_throw.hpp"
#include "consensus/grandpa/common.hpp"
#include "primitives/block_header.hpp"

namespace trestle::consensus::grandpa {

  using Precommit = primitives::detail::BlockInfoT<struct PrecommitTag>;

  struct SignedPrecommit {
    Precommit precommit;
    Signature signature;
    Id id;

    bool operator==(const SignedPrecommit &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SignedPrecommit &v) {
    return s << v.precommit << v.signature << v.id;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SignedPrecommit &v) {
    return s >> v.precommit >> v.signature >> v.id;
  }

  /// A commit message which is an aggregate of precommits.
  struct Commit {
    BlockHash target_hash;
    BlockNumber target_number{};
    std::vector<SignedPrecommit> precommits;

    BlockInfo target() const {
      return {target_number, target_hash};
    }

    bool operator==(const Commit &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Commit &v) {
    return s << v.target_hash << v.target_number << v.precommits;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Commit &v) {
    return s >> v.target_hash >> v.target_number >> v.precommits;
  }

  /**
   * Finality proof of the commit target: signed precommits of the round
   * and the headers connecting precommit targets to the commit target
   */
  struct GrandpaJustification {
    RoundNumber round{};
    Commit commit;
    std::vector<primitives::BlockHeader> votes_ancestries;

    bool operator==(const GrandpaJustification &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const GrandpaJustification &v) {
    return s << v.round << v.commit << v.votes_ancestries;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, GrandpaJustification &v) {
    return s >> v.round >> v.commit >> v.votes_ancestries;
  }

  /// Two different precommits of one authority in one round
  struct Equivocation {
    RoundNumber round{};
    Id id;
    SignedPrecommit first;
    SignedPrecommit second;

    bool operator==(const Equivocation &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Equivocation &v) {
    return s << v.round << v.id << v.first.precommit << v.first.signature
             << v.second.precommit << v.second.signature;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Equivocation &v) {
    s >> v.round >> v.id >> v.first.precommit >> v.first.signature
        >> v.second.precommit >> v.second.signature;
    v.first.id = v.id;
    v.second.id = v.id;
    return s;
  }

  constexpr uint8_t kPrecommitEquivocationIndex = 1;

  /// Precommit equivocation, ready to be reported to the slashing
  /// mechanism. Encoded as the precommit variant of the equivocation enum.
  struct EquivocationProof {
    VoterSetId set_id{};
    Equivocation equivocation;

    bool operator==(const EquivocationProof &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const EquivocationProof &v) {
    return s << v.set_id << kPrecommitEquivocationIndex << v.equivocation;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, EquivocationProof &v) {
    uint8_t index = 0;
    s >> v.set_id >> index;
    if (index != kPrecommitEquivocationIndex) {
      common::raise(scale::DecodeError::WRONG_TYPE_INDEX);
    }
    return s >> v.equivocation;
  }

}  // namespace trestle::consensus::grandpa
