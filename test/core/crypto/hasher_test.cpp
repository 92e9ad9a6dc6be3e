/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"

using trestle::common::Buffer;
using trestle::crypto::Ed25519ProviderImpl;
using trestle::crypto::Ed25519Seed;
using trestle::crypto::HasherImpl;

class HasherTest : public ::testing::Test {
 protected:
  HasherImpl hasher_;
  Buffer input_ = Buffer::fromHex("6920616d2064617461").value();
};

/**
 * @given "i am data"
 * @when hashing it with blake2b of 128 and 256 bits
 * @then reference digests are obtained
 */
TEST_F(HasherTest, Blake2b) {
  EXPECT_EQ(hasher_.blake2b_128(input_).toHex(),
            "de944c5c12e55ee9a07cf5bf4b674995");
  EXPECT_EQ(hasher_.blake2b_256(input_).toHex(),
            "ba67336efd6a3df3a70eeb757860763036785c182ff4cf587541a0068d09f5b2");
}

/**
 * @given empty input
 * @when hashing it with blake2b-256
 * @then the reference digest of the empty string is obtained
 */
TEST_F(HasherTest, Blake2bOfEmptyInput) {
  EXPECT_EQ(hasher_.blake2b_256(Buffer{}).toHex(),
            "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

/**
 * @given a keypair generated from a seed
 * @when signing a message and verifying the signature
 * @then the signature is valid for the message and invalid for another one
 */
TEST_F(HasherTest, Ed25519SignAndVerify) {
  Ed25519ProviderImpl ed25519;
  auto keypair = ed25519.generateKeypair(
      Ed25519Seed{hasher_.blake2b_256(Buffer::fromString("//Alice"))});

  auto signature = ed25519.sign(keypair, input_).value();
  EXPECT_TRUE(ed25519.verify(signature, input_, keypair.public_key).value());

  auto other = Buffer::fromString("other data");
  EXPECT_FALSE(ed25519.verify(signature, other, keypair.public_key).value());
}
