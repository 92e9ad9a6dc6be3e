/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "crypto/ed25519_types.hpp"
#include "primitives/common.hpp"

namespace trestle::primitives {
  using AuthorityWeight = uint64_t;
  using AuthoritySetId = uint64_t;

  /**
   * Authority index
   */
  using AuthorityIndex = uint64_t;

  /**
   * Authority, which participates in finalization
   */
  struct Authority {
    crypto::Ed25519PublicKey id;
    AuthorityWeight weight{};

    bool operator==(const Authority &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Authority &v) {
    return s << v.id << v.weight;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Authority &v) {
    return s >> v.id >> v.weight;
  }

  /**
   * List of authorities
   */
  using AuthorityList = std::vector<Authority>;

  /*
   * List of authorities with an identifier
   */
  struct AuthoritySet {
    AuthoritySet() = default;
    AuthoritySet(AuthoritySetId id, AuthorityList authorities)
        : id{id}, authorities{std::move(authorities)} {}

    AuthoritySetId id{};
    AuthorityList authorities;

    bool operator==(const AuthoritySet &rhs) const = default;

    auto begin() const {
      return authorities.cbegin();
    }

    auto end() const {
      return authorities.cend();
    }
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const AuthoritySet &v) {
    return s << v.authorities << v.id;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, AuthoritySet &v) {
    return s >> v.authorities >> v.id;
  }
}  // namespace trestle::primitives
