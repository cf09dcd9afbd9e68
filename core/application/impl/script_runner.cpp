/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/script_runner.hpp"

#include <charconv>
#include <istream>
#include <limits>
#include <ostream>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include "application/script_error.hpp"
#include "auction/commitment.hpp"
#include "crypto/sha/sha256.hpp"

namespace blindbid::application {

  namespace {
    outcome::result<uint64_t> parseNumber(std::string_view str) {
      uint64_t number = 0;
      auto [ptr, ec] =
          std::from_chars(str.data(), str.data() + str.size(), number);
      if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return ScriptError::INVALID_NUMBER;
      }
      return number;
    }

    outcome::result<bool> parseFlag(std::string_view str) {
      if (str == "true" or str == "1") {
        return true;
      }
      if (str == "false" or str == "0") {
        return false;
      }
      return ScriptError::INVALID_FLAG;
    }

    outcome::result<void> expectArgs(std::span<const std::string> args,
                                     size_t count) {
      if (args.size() != count) {
        return ScriptError::WRONG_ARGUMENT_COUNT;
      }
      return outcome::success();
    }
  }  // namespace

  ScriptRunner::ScriptRunner(std::shared_ptr<crypto::Hasher> hasher,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<escrow::InMemoryEscrow> escrow,
                             std::shared_ptr<auction::BlindAuctionImpl> auction,
                             std::string beneficiary)
      : hasher_{std::move(hasher)},
        clock_{std::move(clock)},
        escrow_{std::move(escrow)},
        auction_{std::move(auction)},
        logger_{log::createLogger("ScriptRunner", "application")} {
    known(beneficiary);
  }

  outcome::result<std::unique_ptr<ScriptRunner>> ScriptRunner::create(
      const AppConfiguration &config, std::shared_ptr<crypto::Hasher> hasher) {
    auto clock = std::make_shared<Clock>(Clock::zero());
    auto escrow = std::make_shared<escrow::InMemoryEscrow>();

    auction::AuctionConfig auction_config{
        .beneficiary = principal(config.beneficiary()),
        .bidding_end = clock->now() + config.biddingTime(),
        .reveal_end =
            clock->now() + config.biddingTime() + config.revealTime(),
    };
    OUTCOME_TRY(auction,
                auction::BlindAuctionImpl::create(
                    auction_config, clock, hasher, escrow));

    return std::unique_ptr<ScriptRunner>(new ScriptRunner(std::move(hasher),
                                                          std::move(clock),
                                                          std::move(escrow),
                                                          std::move(auction),
                                                          config.beneficiary()));
  }

  primitives::AccountId ScriptRunner::principal(std::string_view name) {
    return primitives::AccountId{crypto::sha256(name)};
  }

  outcome::result<Hash256> ScriptRunner::parseSecret(std::string_view secret) {
    if (secret.starts_with("0x")) {
      auto res = Hash256::fromHexWithPrefix(secret);
      if (res.has_error()) {
        return ScriptError::INVALID_SECRET;
      }
      return res.value();
    }
    if (secret.size() > Hash256::size()) {
      return ScriptError::INVALID_SECRET;
    }
    Hash256 padded;
    std::copy(secret.begin(), secret.end(), padded.begin());
    return padded;
  }

  primitives::AccountId ScriptRunner::known(const std::string &name) {
    auto who = principal(name);
    names_.emplace(who, name);
    return who;
  }

  std::string ScriptRunner::nameOf(const primitives::AccountId &who) const {
    if (auto it = names_.find(who); it != names_.end()) {
      return it->second;
    }
    return fmt::format("{}", who);
  }

  outcome::result<std::optional<std::string>> ScriptRunner::execute(
      std::string_view line) {
    if (auto comment = line.find('#'); comment != std::string_view::npos) {
      line = line.substr(0, comment);
    }
    std::string text{line};
    boost::algorithm::trim(text);
    if (text.empty()) {
      return std::nullopt;
    }

    std::vector<std::string> tokens;
    boost::split(tokens,
                 text,
                 boost::algorithm::is_space(),
                 boost::algorithm::token_compress_on);
    const auto &command = tokens.front();
    Args args{std::next(tokens.begin()), tokens.end()};

    SL_TRACE(logger_, "Executing `{}`", text);

    if (command == "advance") {
      return advance(args);
    }
    if (command == "fund") {
      return fund(args);
    }
    if (command == "freeze") {
      return freeze(args, true);
    }
    if (command == "unfreeze") {
      return freeze(args, false);
    }
    if (command == "bid") {
      return bid(args);
    }
    if (command == "commit") {
      return commit(args);
    }
    if (command == "reveal") {
      return reveal(args);
    }
    if (command == "withdraw") {
      return withdraw(args);
    }
    if (command == "end") {
      OUTCOME_TRY(expectArgs(args, 0));
      return end();
    }
    if (command == "status") {
      OUTCOME_TRY(expectArgs(args, 0));
      return status();
    }
    return ScriptError::UNKNOWN_COMMAND;
  }

  outcome::result<std::string> ScriptRunner::advance(Args args) {
    OUTCOME_TRY(expectArgs(args, 1));
    OUTCOME_TRY(seconds, parseNumber(args[0]));
    if (seconds > std::numeric_limits<uint32_t>::max()) {
      return ScriptError::INVALID_NUMBER;
    }
    clock_->advance(std::chrono::duration_cast<Clock::Duration>(
        std::chrono::seconds{seconds}));
    return fmt::format(
        "now {}s, phase {}", clock_->nowUint64(), auction_->phase());
  }

  outcome::result<std::string> ScriptRunner::fund(Args args) {
    OUTCOME_TRY(expectArgs(args, 2));
    OUTCOME_TRY(amount, parseNumber(args[1]));
    auto who = known(args[0]);
    if (auto res = escrow_->fund(who, amount); res.has_error()) {
      return fmt::format("fund {} failed: {}", args[0], res.error().message());
    }
    return fmt::format(
        "{} has balance {}", args[0], escrow_->balanceOf(who));
  }

  outcome::result<std::string> ScriptRunner::freeze(Args args, bool frozen) {
    OUTCOME_TRY(expectArgs(args, 1));
    auto who = known(args[0]);
    if (frozen) {
      escrow_->freeze(who);
      return fmt::format("{} is frozen", args[0]);
    }
    escrow_->unfreeze(who);
    return fmt::format("{} is unfrozen", args[0]);
  }

  outcome::result<std::string> ScriptRunner::bid(Args args) {
    OUTCOME_TRY(expectArgs(args, 5));
    OUTCOME_TRY(value, parseNumber(args[1]));
    OUTCOME_TRY(fake, parseFlag(args[2]));
    OUTCOME_TRY(secret, parseSecret(args[3]));
    OUTCOME_TRY(deposit, parseNumber(args[4]));
    OUTCOME_TRY(commitment,
                auction::makeCommitment(*hasher_, value, fake, secret));
    return placeBid(args[0], commitment, deposit);
  }

  outcome::result<std::string> ScriptRunner::commit(Args args) {
    OUTCOME_TRY(expectArgs(args, 3));
    auto commitment = Hash256::fromHexWithPrefix(args[1]);
    if (commitment.has_error()) {
      return ScriptError::INVALID_SECRET;
    }
    OUTCOME_TRY(deposit, parseNumber(args[2]));
    return placeBid(args[0], commitment.value(), deposit);
  }

  std::string ScriptRunner::placeBid(const std::string &name,
                                     const Hash256 &commitment,
                                     primitives::Balance deposit) {
    auto position = auction_->bid(known(name), commitment, deposit);
    if (position.has_error()) {
      return fmt::format(
          "bid by {} failed: {}", name, position.error().message());
    }
    return fmt::format("{} committed bid #{} with deposit {}",
                       name,
                       position.value(),
                       deposit);
  }

  outcome::result<std::string> ScriptRunner::reveal(Args args) {
    if (args.empty()) {
      return ScriptError::WRONG_ARGUMENT_COUNT;
    }
    std::vector<primitives::Balance> values;
    std::vector<bool> fakes;
    std::vector<Hash256> secrets;
    for (const auto &item : args.subspan(1)) {
      std::string_view view{item};
      auto first = view.find(':');
      auto second = first == std::string_view::npos
                      ? std::string_view::npos
                      : view.find(':', first + 1);
      if (second == std::string_view::npos) {
        return ScriptError::INVALID_REVEAL;
      }
      OUTCOME_TRY(value, parseNumber(view.substr(0, first)));
      OUTCOME_TRY(fake,
                  parseFlag(view.substr(first + 1, second - first - 1)));
      OUTCOME_TRY(secret, parseSecret(view.substr(second + 1)));
      values.push_back(value);
      fakes.push_back(fake);
      secrets.push_back(secret);
    }

    const auto &name = args[0];
    auto receipt = auction_->reveal(known(name), values, fakes, secrets);
    if (receipt.has_error()) {
      return fmt::format(
          "reveal by {} failed: {}", name, receipt.error().message());
    }
    const auto &r = receipt.value();
    return fmt::format(
        "{} revealed: verified {}, forfeited {}, already revealed {}, "
        "accepted {}, refunded {}, deferred {}",
        name,
        r.verified,
        r.forfeited,
        r.already_revealed,
        r.accepted,
        r.refunded,
        r.deferred);
  }

  outcome::result<std::string> ScriptRunner::withdraw(Args args) {
    OUTCOME_TRY(expectArgs(args, 1));
    const auto &name = args[0];
    auto amount = auction_->withdraw(known(name));
    if (amount.has_error()) {
      return fmt::format(
          "withdraw by {} failed: {}", name, amount.error().message());
    }
    return fmt::format("{} withdrew {}", name, amount.value());
  }

  std::string ScriptRunner::end() {
    auto settlement = auction_->end();
    if (settlement.has_error()) {
      return fmt::format("end failed: {}", settlement.error().message());
    }
    const auto &s = settlement.value();
    if (not s.winner.has_value()) {
      return "auction ended without a winner";
    }
    return fmt::format("auction ended, {} won with {}, paid to {}",
                       nameOf(s.winner.value()),
                       s.amount,
                       nameOf(auction_->state().config.beneficiary));
  }

  std::string ScriptRunner::status() const {
    auto state = auction_->state();
    auto accounts = auction_->accounts();
    return fmt::format(
        "phase {}, highest {} {}, deposits {}, paid out {}, outstanding {}, "
        "held {}, unclaimed {}, custody {}",
        auction_->phase(),
        state.highest_bidder.has_value() ? nameOf(*state.highest_bidder)
                                         : std::string{"none"},
        state.highest_bid,
        accounts.total_deposits,
        accounts.total_paid_out,
        accounts.outstanding,
        accounts.held_for_beneficiary,
        accounts.unclaimed,
        escrow_->held());
  }

  bool ScriptRunner::conserved() const {
    auto accounts = auction_->accounts();
    return accounts.balanced()
       and accounts.total_paid_out <= accounts.total_deposits
       and escrow_->held()
               == accounts.total_deposits - accounts.total_paid_out;
  }

  outcome::result<void> ScriptRunner::run(std::istream &in,
                                          std::ostream &out) {
    std::string line;
    size_t number = 0;
    while (std::getline(in, line)) {
      ++number;
      auto res = execute(line);
      if (res.has_error()) {
        SL_ERROR(logger_,
                 "Line {} `{}` is not executed: {}",
                 number,
                 line,
                 res.error().message());
        out << "line " << number << ": " << res.error().message()
            << std::endl;
        return res.as_failure();
      }
      if (res.value().has_value()) {
        out << res.value().value() << std::endl;
      }
      if (not conserved()) {
        SL_ERROR(logger_,
                 "Funds are not conserved after line {}: {}",
                 number,
                 status());
        return ScriptError::CONSERVATION_VIOLATED;
      }
    }
    return outcome::success();
  }

}  // namespace blindbid::application
