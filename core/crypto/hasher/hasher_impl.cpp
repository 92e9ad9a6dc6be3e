/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <blake2.h>
#include <boost/assert.hpp>

namespace trestle::crypto {

  using common::Hash128;
  using common::Hash256;

  namespace {
    template <size_t N>
    common::Blob<N> blake2b(common::BufferView data) {
      common::Blob<N> out;
      blake2b_state state;
      BOOST_VERIFY(blake2b_init(&state, N) == 0);
      BOOST_VERIFY(blake2b_update(&state, data.data(), data.size()) == 0);
      BOOST_VERIFY(blake2b_final(&state, out.data(), N) == 0);
      return out;
    }
  }  // namespace

  Hash128 HasherImpl::blake2b_128(common::BufferView data) const {
    return blake2b<16>(data);
  }

  Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    return blake2b<32>(data);
  }

}  // namespace trestle::crypto
