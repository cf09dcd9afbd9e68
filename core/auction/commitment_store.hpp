/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <unordered_map>
#include <vector>

#include "auction/types.hpp"

namespace blindbid::auction {

  /**
   * Append-only storage of committed bids.
   *
   * All bids live in one flat arena in submission order. Every principal
   * owns a chain through the arena, so its own bids are visited in the order
   * they were committed, which is the order reveal arrays must follow.
   */
  class CommitmentStore {
   public:
    /**
     * Appends a bid to the principal's sequence
     * @return position of the new bid within the principal's sequence
     */
    size_t record(const AccountId &who,
                  const Hash256 &commitment,
                  Balance deposit);

    /// number of bids committed by a principal
    size_t count(const AccountId &who) const;

    /// bids of a principal, in commitment order
    std::vector<Bid> bidsOf(const AccountId &who) const;

    /// number of bids committed by everyone
    size_t totalBids() const {
      return arena_.size();
    }

    /**
     * Calls f(position, bid) for each bid of the principal in commitment
     * order. The bid is passed by mutable reference.
     */
    template <typename F>
    void visit(const AccountId &who, F &&f) {
      auto it = chains_.find(who);
      if (it == chains_.end()) {
        return;
      }
      size_t position = 0;
      for (auto index = it->second.first; index != kNone;
           index = arena_[index].next) {
        f(position++, arena_[index].bid);
      }
    }

   private:
    static constexpr size_t kNone = std::numeric_limits<size_t>::max();

    struct Slot {
      Bid bid;
      size_t next = kNone;
    };

    struct Chain {
      size_t first = kNone;
      size_t last = kNone;
      size_t count = 0;
    };

    std::vector<Slot> arena_;
    std::unordered_map<AccountId, Chain> chains_;
  };

}  // namespace blindbid::auction
