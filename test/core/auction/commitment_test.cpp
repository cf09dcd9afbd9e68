/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/commitment.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "crypto/hasher/hasher_impl.hpp"
#include "mock/core/crypto/hasher_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using blindbid::auction::makeCommitment;
using blindbid::common::BufferView;
using blindbid::common::Hash256;
using blindbid::crypto::HasherImpl;
using blindbid::crypto::HasherMock;
using testing::Return;

/**
 * @given hasher mock
 * @when commitment of (value, fake, secret) is made
 * @then hasher receives value as 8 little-endian bytes, fake as one byte and
 * the 32 bytes of the secret, and its digest is the commitment
 */
TEST(CommitmentTest, HashedLayout) {
  HasherMock hasher;
  Hash256 secret;
  for (size_t i = 0; i < secret.size(); ++i) {
    secret[i] = static_cast<uint8_t>(i + 1);
  }

  std::vector<uint8_t> expected{0x02, 0x01, 0, 0, 0, 0, 0, 0, 0x01};
  expected.insert(expected.end(), secret.begin(), secret.end());

  EXPECT_CALL(hasher, sha2_256(BufferView{expected}))
      .WillOnce(Return("digest"_hash256));

  EXPECT_OUTCOME_TRUE(commitment, makeCommitment(hasher, 0x0102, true, secret));
  EXPECT_EQ(commitment, "digest"_hash256);
}

/**
 * @given real hasher
 * @when commitments of triples differing in one component are made
 * @then they all differ, and the same triple gives the same commitment
 */
TEST(CommitmentTest, Binding) {
  HasherImpl hasher;
  auto secret = "secret"_hash256;

  EXPECT_OUTCOME_TRUE(base, makeCommitment(hasher, 10, false, secret));
  EXPECT_OUTCOME_TRUE(same, makeCommitment(hasher, 10, false, secret));
  EXPECT_OUTCOME_TRUE(other_value, makeCommitment(hasher, 11, false, secret));
  EXPECT_OUTCOME_TRUE(other_fake, makeCommitment(hasher, 10, true, secret));
  EXPECT_OUTCOME_TRUE(other_secret,
                      makeCommitment(hasher, 10, false, "other"_hash256));

  EXPECT_EQ(base, same);
  EXPECT_NE(base, other_value);
  EXPECT_NE(base, other_fake);
  EXPECT_NE(base, other_secret);
  EXPECT_FALSE(base.isZero());
}
