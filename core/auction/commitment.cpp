/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/commitment.hpp"

#include <array>
#include <tuple>

#include <scale/scale.hpp>

namespace blindbid::auction {

  outcome::result<Hash256> makeCommitment(const crypto::Hasher &hasher,
                                          Balance value,
                                          bool fake,
                                          const Hash256 &secret) {
    const std::array<uint8_t, Hash256::size()> &secret_bytes = secret;
    OUTCOME_TRY(encoded,
                scale::encode(std::make_tuple(value, fake, secret_bytes)));
    return hasher.sha2_256(encoded);
  }

}  // namespace blindbid::auction
