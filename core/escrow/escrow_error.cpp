/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "escrow/escrow_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blindbid::escrow, EscrowError, e) {
  using E = blindbid::escrow::EscrowError;
  switch (e) {
    case E::INSUFFICIENT_FUNDS:
      return "Not enough funds to move";
    case E::DESTINATION_FROZEN:
      return "Destination account does not accept funds";
    case E::BALANCE_OVERFLOW:
      return "Balance would overflow";
  }
  return "Unknown escrow error";
}
