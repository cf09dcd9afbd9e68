/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/auction_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blindbid::auction, AuctionError, e) {
  using E = blindbid::auction::AuctionError;
  switch (e) {
    case E::PHASE_VIOLATION:
      return "Operation is not allowed in the current auction phase";
    case E::LENGTH_MISMATCH:
      return "Number of revealed values does not match number of bids";
    case E::UNVERIFIED_COMMITMENT:
      return "Revealed bid does not match its commitment";
    case E::ALREADY_ENDED:
      return "Auction has already been ended";
    case E::TRANSFER_FAILURE:
      return "Escrow failed to transfer funds";
    case E::INVALID_DEADLINES:
      return "Bidding must end strictly before reveal ends";
    case E::EMPTY_COMMITMENT:
      return "Commitment must not be all zeroes";
  }
  return "Unknown auction error";
}
