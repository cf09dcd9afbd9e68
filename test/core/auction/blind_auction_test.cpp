/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auction/impl/blind_auction_impl.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "auction/auction_error.hpp"
#include "auction/commitment.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "escrow/escrow_error.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/escrow/escrow_mock.hpp"
#include "primitives/arithmetic_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace blindbid::auction;
using blindbid::clock::SystemClockMock;
using blindbid::crypto::HasherImpl;
using blindbid::escrow::EscrowError;
using blindbid::escrow::EscrowMock;
using blindbid::primitives::ArithmeticError;
using testing::_;
using testing::Invoke;
using testing::Return;
using testing::ReturnPointee;

using namespace std::chrono_literals;

class BlindAuctionTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    EXPECT_CALL(*clock, now()).WillRepeatedly(ReturnPointee(&now));
    ON_CALL(*escrow, collect(_, _)).WillByDefault(Return(outcome::success()));
    EXPECT_CALL(*escrow, collect(_, _)).Times(testing::AnyNumber());
    ON_CALL(*escrow, transfer(_, _))
        .WillByDefault(
            Invoke([this](const AccountId &to,
                          Balance amount) -> outcome::result<void> {
              paid[to] += amount;
              return outcome::success();
            }));
    EXPECT_CALL(*escrow, transfer(_, _)).Times(testing::AnyNumber());

    auction = BlindAuctionImpl::create(config, clock, hasher, escrow).value();
  }

 protected:
  Hash256 commitment(Balance value, bool fake, const Hash256 &secret) {
    return makeCommitment(*hasher, value, fake, secret).value();
  }

  void toReveal() {
    now = config.bidding_end;
  }

  void toSettlement() {
    now = config.reveal_end;
  }

  static outcome::result<void> frozen() {
    return EscrowError::DESTINATION_FROZEN;
  }

  static outcome::result<void> noFunds() {
    return EscrowError::INSUFFICIENT_FUNDS;
  }

  void expectBalanced() {
    EXPECT_TRUE(auction->accounts().balanced());
  }

  AccountId beneficiary = "beneficiary"_account;
  AccountId alice = "alice"_account;
  AccountId bob = "bob"_account;
  AccountId carol = "carol"_account;

  AuctionConfig config{
      .beneficiary = beneficiary,
      .bidding_end = TimePoint{100s},
      .reveal_end = TimePoint{200s},
  };

  TimePoint now{10s};
  std::unordered_map<AccountId, Balance> paid;

  std::shared_ptr<SystemClockMock> clock = std::make_shared<SystemClockMock>();
  std::shared_ptr<EscrowMock> escrow = std::make_shared<EscrowMock>();
  std::shared_ptr<HasherImpl> hasher = std::make_shared<HasherImpl>();
  std::shared_ptr<BlindAuctionImpl> auction;
};

/**
 * @given bidding end not before reveal end
 * @when auction is created
 * @then INVALID_DEADLINES is returned
 */
TEST_F(BlindAuctionTest, InvalidDeadlines) {
  auto same = config;
  same.reveal_end = same.bidding_end;
  EXPECT_EC(BlindAuctionImpl::create(same, clock, hasher, escrow),
            AuctionError::INVALID_DEADLINES);

  auto reversed = config;
  reversed.bidding_end = TimePoint{300s};
  EXPECT_EC(BlindAuctionImpl::create(reversed, clock, hasher, escrow),
            AuctionError::INVALID_DEADLINES);
}

/**
 * @given A bids 10 with deposit 15, B bids 8 with deposit 8
 * @when both reveal and the auction is ended
 * @then A is refunded 5, B is refunded 8, A wins with 10 which is paid to
 * the beneficiary
 */
TEST_F(BlindAuctionTest, HigherBidWins) {
  EXPECT_OUTCOME_TRUE(
      a_pos, auction->bid(alice, commitment(10, false, "s1"_hash256), 15));
  EXPECT_OUTCOME_TRUE(
      b_pos, auction->bid(bob, commitment(8, false, "s2"_hash256), 8));
  EXPECT_EQ(a_pos, 0);
  EXPECT_EQ(b_pos, 0);
  expectBalanced();

  toReveal();
  EXPECT_OUTCOME_TRUE(
      a_receipt, auction->reveal(alice, {10}, {false}, {"s1"_hash256}));
  EXPECT_EQ(a_receipt.verified, 1);
  EXPECT_EQ(a_receipt.accepted, 1);
  EXPECT_EQ(a_receipt.refunded, 5);
  EXPECT_EQ(paid[alice], 5);

  EXPECT_OUTCOME_TRUE(
      b_receipt, auction->reveal(bob, {8}, {false}, {"s2"_hash256}));
  EXPECT_EQ(b_receipt.accepted, 0);
  EXPECT_EQ(b_receipt.refunded, 8);
  EXPECT_EQ(paid[bob], 8);

  auto state = auction->state();
  EXPECT_EQ(state.highest_bid, 10);
  EXPECT_EQ(state.highest_bidder, alice);
  expectBalanced();

  toSettlement();
  EXPECT_OUTCOME_TRUE(settlement, auction->end());
  EXPECT_EQ(settlement.winner, alice);
  EXPECT_EQ(settlement.amount, 10);
  EXPECT_EQ(paid[beneficiary], 10);

  auto accounts = auction->accounts();
  EXPECT_TRUE(accounts.balanced());
  EXPECT_EQ(accounts.unclaimed, 0);
  EXPECT_EQ(accounts.total_paid_out, accounts.total_deposits);
}

/**
 * @given C commits a fake bid with deposit 20 and a real bid of 5 with
 * deposit 5
 * @when C reveals both
 * @then 20 is refunded and the real bid is kept as the highest
 */
TEST_F(BlindAuctionTest, DecoyBid) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(carol, commitment(50, true, "decoy"_hash256), 20));
  EXPECT_OUTCOME_TRUE(
      position, auction->bid(carol, commitment(5, false, "real"_hash256), 5));
  EXPECT_EQ(position, 1);
  EXPECT_EQ(auction->bidsOf(carol).size(), 2);

  toReveal();
  EXPECT_OUTCOME_TRUE(
      receipt,
      auction->reveal(
          carol, {50, 5}, {true, false}, {"decoy"_hash256, "real"_hash256}));
  EXPECT_EQ(receipt.verified, 2);
  EXPECT_EQ(receipt.accepted, 1);
  EXPECT_EQ(receipt.refunded, 20);
  EXPECT_EQ(auction->state().highest_bid, 5);
  expectBalanced();
}

/**
 * @given an outbid principal
 * @when they withdraw twice
 * @then the outbid amount is paid once, the second withdrawal pays nothing
 */
TEST_F(BlindAuctionTest, OutbidWithdraws) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(bob, commitment(8, false, "b"_hash256), 8));
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "a"_hash256), 10));

  toReveal();
  EXPECT_OUTCOME_TRUE_1(auction->reveal(bob, {8}, {false}, {"b"_hash256}));
  EXPECT_OUTCOME_TRUE_1(auction->reveal(alice, {10}, {false}, {"a"_hash256}));
  EXPECT_EQ(auction->pendingReturn(bob), 8);
  expectBalanced();

  EXPECT_OUTCOME_TRUE(first, auction->withdraw(bob));
  EXPECT_EQ(first, 8);
  EXPECT_EQ(paid[bob], 8);
  EXPECT_OUTCOME_TRUE(second, auction->withdraw(bob));
  EXPECT_EQ(second, 0);
  EXPECT_EQ(paid[bob], 8);
  EXPECT_EQ(auction->pendingReturn(bob), 0);
  expectBalanced();
}

/**
 * @given operations called outside of their phase
 * @when they are executed
 * @then PHASE_VIOLATION is returned and nothing changes
 */
TEST_F(BlindAuctionTest, PhaseViolations) {
  auto c = commitment(10, false, "s"_hash256);
  EXPECT_EC(auction->reveal(alice, {}, {}, {}), AuctionError::PHASE_VIOLATION);
  EXPECT_EC(auction->end(), AuctionError::PHASE_VIOLATION);
  EXPECT_OUTCOME_TRUE_1(auction->bid(alice, c, 10));

  toReveal();
  EXPECT_EC(auction->bid(alice, c, 10), AuctionError::PHASE_VIOLATION);
  EXPECT_EC(auction->end(), AuctionError::PHASE_VIOLATION);

  toSettlement();
  EXPECT_EC(auction->bid(alice, c, 10), AuctionError::PHASE_VIOLATION);
  EXPECT_EC(auction->reveal(alice, {10}, {false}, {"s"_hash256}),
            AuctionError::PHASE_VIOLATION);
  EXPECT_EQ(auction->accounts().total_deposits, 10);
  EXPECT_EQ(auction->accounts().unclaimed, 10);
}

/**
 * @given bidder whose deposit can not be collected
 * @when they bid
 * @then TRANSFER_FAILURE is returned, no bid is recorded and the totals do
 * not change, while a bid with a collectable deposit is recorded
 */
TEST_F(BlindAuctionTest, DepositNotCollected) {
  EXPECT_CALL(*escrow, collect(alice, 15)).WillOnce(Return(noFunds()));
  EXPECT_EC(auction->bid(alice, commitment(10, false, "s1"_hash256), 15),
            AuctionError::TRANSFER_FAILURE);
  EXPECT_TRUE(auction->bidsOf(alice).empty());
  EXPECT_EQ(auction->accounts().total_deposits, 0);
  EXPECT_EQ(auction->accounts().unclaimed, 0);
  expectBalanced();

  EXPECT_CALL(*escrow, collect(bob, 8)).Times(1);
  EXPECT_OUTCOME_TRUE(
      position, auction->bid(bob, commitment(8, false, "s2"_hash256), 8));
  EXPECT_EQ(position, 0);
  EXPECT_EQ(auction->accounts().total_deposits, 8);
  expectBalanced();

  toReveal();
  EXPECT_EC(auction->reveal(alice, {10}, {false}, {"s1"_hash256}),
            AuctionError::LENGTH_MISMATCH);
  EXPECT_EQ(paid[alice], 0);
}

/**
 * @given all-zero commitment
 * @when it is bid
 * @then EMPTY_COMMITMENT is returned
 */
TEST_F(BlindAuctionTest, EmptyCommitment) {
  EXPECT_EC(auction->bid(alice, Hash256{}, 10),
            AuctionError::EMPTY_COMMITMENT);
  EXPECT_TRUE(auction->bidsOf(alice).empty());
}

/**
 * @given deposits summing close to the maximum balance
 * @when one more deposit would overflow the total
 * @then overflow is reported and the bid is not recorded
 */
TEST_F(BlindAuctionTest, DepositOverflow) {
  EXPECT_OUTCOME_TRUE_1(auction->bid(
      alice, "a"_hash256, std::numeric_limits<Balance>::max() - 1));
  EXPECT_CALL(*escrow, collect(bob, _)).Times(0);
  EXPECT_EC(auction->bid(bob, "b"_hash256, 2), ArithmeticError::Overflow);
  EXPECT_TRUE(auction->bidsOf(bob).empty());
  expectBalanced();
}

/**
 * @given bids revealed with wrong length inputs
 * @when reveal is called
 * @then LENGTH_MISMATCH is returned
 */
TEST_F(BlindAuctionTest, LengthMismatch) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(1, false, "s"_hash256), 1));
  toReveal();
  EXPECT_EC(auction->reveal(alice, {1, 2}, {false, false}, {"s"_hash256}),
            AuctionError::LENGTH_MISMATCH);
}

/**
 * @given revealed bid
 * @when the same bids are revealed again
 * @then nothing more is refunded and the bid counts as already revealed,
 * not as forfeited
 */
TEST_F(BlindAuctionTest, DoubleReveal) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, true, "s"_hash256), 10));
  toReveal();
  EXPECT_OUTCOME_TRUE(first, auction->reveal(alice, {10}, {true}, {"s"_hash256}));
  EXPECT_EQ(first.refunded, 10);
  EXPECT_OUTCOME_TRUE(second,
                      auction->reveal(alice, {10}, {true}, {"s"_hash256}));
  EXPECT_EQ(first.already_revealed, 0);
  EXPECT_EQ(second.refunded, 0);
  EXPECT_EQ(second.verified, 0);
  EXPECT_EQ(second.forfeited, 0);
  EXPECT_EQ(second.already_revealed, 1);
  EXPECT_EQ(paid[alice], 10);
  expectBalanced();
}

/**
 * @given bid revealed with a wrong secret
 * @when reveal is processed
 * @then nothing is refunded, the highest bid is not affected and the deposit
 * stays unclaimed
 */
TEST_F(BlindAuctionTest, MismatchedTriple) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "s"_hash256), 10));
  toReveal();
  EXPECT_OUTCOME_TRUE(receipt,
                      auction->reveal(alice, {10}, {false}, {"x"_hash256}));
  EXPECT_EQ(receipt.forfeited, 1);
  EXPECT_EQ(receipt.already_revealed, 0);
  EXPECT_EQ(receipt.refunded, 0);
  EXPECT_FALSE(auction->state().highest_bidder.has_value());
  EXPECT_EQ(auction->accounts().unclaimed, 10);
  expectBalanced();
}

/**
 * @given sequence of reveals with increasing and decreasing values
 * @when they are processed
 * @then highest bid never decreases and events are emitted only for
 * increases
 */
TEST_F(BlindAuctionTest, HighestBidNonDecreasing) {
  std::vector<std::pair<AccountId, Balance>> events;
  auto connection = auction->onHighestBidIncreased(
      [&](const AccountId &bidder, Balance amount) {
        events.emplace_back(bidder, amount);
      });

  std::vector<std::pair<AccountId, Balance>> bids{
      {alice, 5}, {bob, 9}, {carol, 7}, {"dave"_account, 12}};
  for (auto &[who, value] : bids) {
    EXPECT_OUTCOME_TRUE_1(
        auction->bid(who, commitment(value, false, "s"_hash256), value));
  }

  toReveal();
  Balance last = 0;
  for (auto &[who, value] : bids) {
    EXPECT_OUTCOME_TRUE_1(
        auction->reveal(who, {value}, {false}, {"s"_hash256}));
    auto highest = auction->state().highest_bid;
    EXPECT_GE(highest, last);
    last = highest;
    expectBalanced();
  }
  EXPECT_EQ(last, 12);

  ASSERT_EQ(events.size(), 3);
  EXPECT_EQ(events[0], std::make_pair(alice, Balance{5}));
  EXPECT_EQ(events[1], std::make_pair(bob, Balance{9}));
  EXPECT_EQ(events[2].second, 12);
  EXPECT_EQ(auction->pendingReturn(alice), 5);
  EXPECT_EQ(auction->pendingReturn(bob), 9);
  EXPECT_EQ(auction->pendingReturn(carol), 0);
}

/**
 * @given settleable auction with a winner
 * @when end is called twice
 * @then first call pays the beneficiary and emits the event, second one
 * returns ALREADY_ENDED
 */
TEST_F(BlindAuctionTest, EndTwice) {
  std::optional<std::pair<std::optional<AccountId>, Balance>> ended;
  auto connection = auction->onAuctionEnded(
      [&](const std::optional<AccountId> &winner, Balance amount) {
        ended.emplace(winner, amount);
      });

  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "s"_hash256), 10));
  toReveal();
  EXPECT_OUTCOME_TRUE_1(auction->reveal(alice, {10}, {false}, {"s"_hash256}));
  toSettlement();

  EXPECT_OUTCOME_TRUE_1(auction->end());
  EXPECT_EC(auction->end(), AuctionError::ALREADY_ENDED);
  EXPECT_EQ(paid[beneficiary], 10);
  EXPECT_EQ(auction->phase(), Phase::Ended);
  ASSERT_TRUE(ended.has_value());
  EXPECT_EQ(ended->first, alice);
  EXPECT_EQ(ended->second, 10);
  expectBalanced();
}

/**
 * @given auction without bids
 * @when it is ended
 * @then nothing is transferred and there is no winner
 */
TEST_F(BlindAuctionTest, EndWithoutBids) {
  toSettlement();
  EXPECT_CALL(*escrow, transfer(_, _)).Times(0);
  EXPECT_OUTCOME_TRUE(settlement, auction->end());
  EXPECT_FALSE(settlement.winner.has_value());
  EXPECT_EQ(settlement.amount, 0);
}

/**
 * @given bidder whose account refuses transfers
 * @when their reveal produces a refund
 * @then reveal succeeds, the refund is deferred to the withdrawal ledger and
 * can be withdrawn once transfers work again
 */
TEST_F(BlindAuctionTest, RevealRefundDeferred) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "s"_hash256), 15));
  toReveal();

  EXPECT_CALL(*escrow, transfer(alice, 5)).WillOnce(Return(frozen()));
  EXPECT_OUTCOME_TRUE(receipt,
                      auction->reveal(alice, {10}, {false}, {"s"_hash256}));
  EXPECT_EQ(receipt.refunded, 0);
  EXPECT_EQ(receipt.deferred, 5);
  EXPECT_EQ(auction->pendingReturn(alice), 5);
  EXPECT_EQ(auction->state().highest_bid, 10);
  expectBalanced();

  testing::Mock::VerifyAndClearExpectations(escrow.get());
  EXPECT_CALL(*escrow, transfer(alice, 5)).Times(1);
  EXPECT_OUTCOME_TRUE(amount, auction->withdraw(alice));
  EXPECT_EQ(amount, 5);
  expectBalanced();
}

/**
 * @given outbid principal whose account refuses transfers
 * @when they withdraw
 * @then TRANSFER_FAILURE is returned and the amount stays owed
 */
TEST_F(BlindAuctionTest, WithdrawFailureRestores) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(bob, commitment(8, false, "b"_hash256), 8));
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "a"_hash256), 10));
  toReveal();
  EXPECT_OUTCOME_TRUE_1(auction->reveal(bob, {8}, {false}, {"b"_hash256}));
  EXPECT_OUTCOME_TRUE_1(auction->reveal(alice, {10}, {false}, {"a"_hash256}));

  EXPECT_CALL(*escrow, transfer(bob, 8)).WillOnce(Return(frozen()));
  EXPECT_EC(auction->withdraw(bob), AuctionError::TRANSFER_FAILURE);
  EXPECT_EQ(auction->pendingReturn(bob), 8);
  expectBalanced();
}

/**
 * @given beneficiary refusing transfers
 * @when the auction is ended
 * @then TRANSFER_FAILURE is returned, the auction is not ended and a later
 * end succeeds
 */
TEST_F(BlindAuctionTest, EndFailureRetried) {
  EXPECT_OUTCOME_TRUE_1(
      auction->bid(alice, commitment(10, false, "s"_hash256), 10));
  toReveal();
  EXPECT_OUTCOME_TRUE_1(auction->reveal(alice, {10}, {false}, {"s"_hash256}));
  toSettlement();

  EXPECT_CALL(*escrow, transfer(beneficiary, 10)).WillOnce(Return(frozen()));
  EXPECT_EC(auction->end(), AuctionError::TRANSFER_FAILURE);
  EXPECT_FALSE(auction->state().ended);
  EXPECT_EQ(auction->phase(), Phase::Settleable);
  EXPECT_EQ(auction->accounts().held_for_beneficiary, 10);
  expectBalanced();

  testing::Mock::VerifyAndClearExpectations(escrow.get());
  EXPECT_CALL(*escrow, transfer(beneficiary, 10)).Times(1);
  EXPECT_OUTCOME_TRUE(settlement, auction->end());
  EXPECT_EQ(settlement.amount, 10);
  expectBalanced();
}

/**
 * @given clock which goes back after reveal started
 * @when a bid is attempted
 * @then the auction stays in the reveal phase and rejects the bid
 */
TEST_F(BlindAuctionTest, ClockGoingBackIgnored) {
  toReveal();
  EXPECT_EQ(auction->phase(), Phase::Reveal);
  EXPECT_OUTCOME_TRUE_1(auction->reveal(alice, {}, {}, {}));

  now = TimePoint{50s};
  EXPECT_EC(auction->bid(alice, commitment(1, false, "s"_hash256), 1),
            AuctionError::PHASE_VIOLATION);
  EXPECT_EQ(auction->phase(), Phase::Reveal);
}

/**
 * @given bidders committing, then revealing and withdrawing, from many
 * threads at once
 * @when every thread is done
 * @then accounts are balanced, the largest real value is the highest bid
 * and highest bid events arrive in increasing order
 */
TEST_F(BlindAuctionTest, ConcurrentAccess) {
  constexpr size_t kBidders = 8;
  constexpr size_t kBidsEach = 12;

  struct Bidder {
    AccountId id;
    std::vector<Hash256> commitments;
    std::vector<Balance> deposits;
    std::vector<Balance> values;
    std::vector<bool> fakes;
    std::vector<Hash256> secrets;
  };

  std::vector<Bidder> bidders(kBidders);
  Balance total_deposits = 0;
  Balance max_real_value = 0;
  for (size_t i = 0; i < kBidders; ++i) {
    auto &bidder = bidders[i];
    bidder.id[0] = static_cast<uint8_t>(i + 1);
    for (size_t j = 0; j < kBidsEach; ++j) {
      Balance value = j * kBidders + i + 1;
      bool fake = j % 3 == 2;
      Hash256 secret;
      secret[0] = static_cast<uint8_t>(i);
      secret[1] = static_cast<uint8_t>(j);
      bidder.commitments.push_back(commitment(value, fake, secret));
      bidder.deposits.push_back(value + i);
      bidder.values.push_back(value);
      bidder.fakes.push_back(fake);
      bidder.secrets.push_back(secret);
      total_deposits += value + i;
      if (not fake) {
        max_real_value = std::max(max_real_value, value);
      }
    }
  }

  std::mutex increases_mutex;
  std::vector<Balance> increases;
  auto connection = auction->onHighestBidIncreased(
      [&](const AccountId &, Balance amount) {
        std::lock_guard lock{increases_mutex};
        increases.push_back(amount);
      });

  auto run_all = [](size_t count, const std::function<void(size_t)> &f) {
    std::vector<std::thread> threads;
    for (size_t i = 0; i < count; ++i) {
      threads.emplace_back(f, i);
    }
    for (auto &thread : threads) {
      thread.join();
    }
  };

  run_all(kBidders, [&](size_t i) {
    auto &bidder = bidders[i];
    for (size_t j = 0; j < kBidsEach; ++j) {
      EXPECT_OUTCOME_TRUE(
          position,
          auction->bid(bidder.id, bidder.commitments[j], bidder.deposits[j]));
      EXPECT_EQ(position, j);
    }
  });
  EXPECT_EQ(auction->accounts().total_deposits, total_deposits);
  expectBalanced();

  toReveal();
  run_all(kBidders * 2, [&](size_t n) {
    auto &bidder = bidders[n % kBidders];
    if (n < kBidders) {
      EXPECT_OUTCOME_TRUE(receipt,
                          auction->reveal(bidder.id,
                                          bidder.values,
                                          bidder.fakes,
                                          bidder.secrets));
      EXPECT_EQ(receipt.verified, kBidsEach);
      EXPECT_EQ(receipt.forfeited, 0);
    }
    for (int k = 0; k < 5; ++k) {
      EXPECT_OUTCOME_TRUE_1(auction->withdraw(bidder.id));
      std::this_thread::yield();
    }
  });
  for (auto &bidder : bidders) {
    EXPECT_OUTCOME_TRUE_1(auction->withdraw(bidder.id));
  }

  auto state = auction->state();
  EXPECT_EQ(state.highest_bid, max_real_value);

  auto accounts = auction->accounts();
  EXPECT_TRUE(accounts.balanced());
  EXPECT_EQ(accounts.unclaimed, 0);
  EXPECT_EQ(accounts.outstanding, 0);
  EXPECT_EQ(accounts.total_paid_out, total_deposits - max_real_value);

  Balance paid_to_bidders = 0;
  for (auto &bidder : bidders) {
    paid_to_bidders += paid[bidder.id];
  }
  EXPECT_EQ(paid_to_bidders, accounts.total_paid_out);

  ASSERT_FALSE(increases.empty());
  EXPECT_EQ(std::adjacent_find(
                increases.begin(), increases.end(), std::greater_equal<>()),
            increases.end());
  EXPECT_EQ(increases.back(), max_real_value);
}
