/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/commitment_store.hpp"

namespace blindbid::auction {

  size_t CommitmentStore::record(const AccountId &who,
                                 const Hash256 &commitment,
                                 Balance deposit) {
    auto index = arena_.size();
    arena_.push_back(Slot{.bid = Bid{commitment, deposit}});

    auto &chain = chains_[who];
    if (chain.last == kNone) {
      chain.first = index;
    } else {
      arena_[chain.last].next = index;
    }
    chain.last = index;
    return chain.count++;
  }

  size_t CommitmentStore::count(const AccountId &who) const {
    auto it = chains_.find(who);
    return it == chains_.end() ? 0 : it->second.count;
  }

  std::vector<Bid> CommitmentStore::bidsOf(const AccountId &who) const {
    std::vector<Bid> bids;
    auto it = chains_.find(who);
    if (it == chains_.end()) {
      return bids;
    }
    bids.reserve(it->second.count);
    for (auto index = it->second.first; index != kNone;
         index = arena_[index].next) {
      bids.push_back(arena_[index].bid);
    }
    return bids;
  }

}  // namespace blindbid::auction
