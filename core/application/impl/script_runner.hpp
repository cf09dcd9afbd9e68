/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "application/app_configuration.hpp"
#include "auction/impl/blind_auction_impl.hpp"
#include "clock/impl/manual_clock.hpp"
#include "crypto/hasher.hpp"
#include "escrow/impl/in_memory_escrow.hpp"
#include "log/logger.hpp"

namespace blindbid::application {

  /**
   * Replays a textual auction script against an in-memory escrow and a
   * manually advanced clock. The clock starts at the epoch, bidding ends
   * after the configured bidding time and reveal ends after the reveal
   * time.
   */
  class ScriptRunner {
   public:
    using Clock = clock::ManualClock;

    static outcome::result<std::unique_ptr<ScriptRunner>> create(
        const AppConfiguration &config,
        std::shared_ptr<crypto::Hasher> hasher);

    /**
     * Executes one script line
     * @return line to print, std::nullopt for blank and comment lines, an
     * error if the line can not be parsed. Failures of the auction itself are
     * reported in the returned line.
     */
    outcome::result<std::optional<std::string>> execute(std::string_view line);

    /**
     * Executes lines until the end of input or the first line that can not
     * be parsed
     */
    outcome::result<void> run(std::istream &in, std::ostream &out);

    /// escrow custody and auction accounts agree
    bool conserved() const;

    /// account id of a named principal
    static primitives::AccountId principal(std::string_view name);

    static outcome::result<Hash256> parseSecret(std::string_view secret);

    const auction::BlindAuction &auction() const {
      return *auction_;
    }

    const escrow::InMemoryEscrow &escrow() const {
      return *escrow_;
    }

   private:
    using Args = std::span<const std::string>;

    ScriptRunner(std::shared_ptr<crypto::Hasher> hasher,
                 std::shared_ptr<Clock> clock,
                 std::shared_ptr<escrow::InMemoryEscrow> escrow,
                 std::shared_ptr<auction::BlindAuctionImpl> auction,
                 std::string beneficiary);

    outcome::result<std::string> advance(Args args);
    outcome::result<std::string> fund(Args args);
    outcome::result<std::string> freeze(Args args, bool frozen);
    outcome::result<std::string> bid(Args args);
    outcome::result<std::string> commit(Args args);
    outcome::result<std::string> reveal(Args args);
    outcome::result<std::string> withdraw(Args args);
    std::string end();
    std::string status() const;

    std::string placeBid(const std::string &name,
                         const Hash256 &commitment,
                         primitives::Balance deposit);

    /// remembers the name so that it can be printed back
    primitives::AccountId known(const std::string &name);

    std::string nameOf(const primitives::AccountId &who) const;

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<escrow::InMemoryEscrow> escrow_;
    std::shared_ptr<auction::BlindAuctionImpl> auction_;
    std::unordered_map<primitives::AccountId, std::string> names_;
    log::Logger logger_;
  };

}  // namespace blindbid::application
