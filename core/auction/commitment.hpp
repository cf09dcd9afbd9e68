/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "auction/types.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

namespace blindbid::auction {

  /**
   * Computes the commitment binding a bidder to (value, fake, secret).
   * The digest is sha2_256 over the SCALE encoding of the triple, so
   * bidders can compute it off-line before submitting a bid.
   */
  outcome::result<Hash256> makeCommitment(const crypto::Hasher &hasher,
                                          Balance value,
                                          bool fake,
                                          const Hash256 &secret);

}  // namespace blindbid::auction
