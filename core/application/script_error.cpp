/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/script_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blindbid::application, ScriptError, e) {
  switch (e) {
    using enum blindbid::application::ScriptError;
    case UNKNOWN_COMMAND:
      return "Unknown command";
    case WRONG_ARGUMENT_COUNT:
      return "Wrong number of arguments for the command";
    case INVALID_NUMBER:
      return "Argument is not an unsigned 64-bit number";
    case INVALID_FLAG:
      return "Flag must be one of true, false, 1, 0";
    case INVALID_SECRET:
      return "Secret is neither 0x-prefixed 32 bytes nor text of at most 32 "
             "bytes";
    case INVALID_REVEAL:
      return "Reveal item must look like VALUE:FAKE:SECRET";
    case CONSERVATION_VIOLATED:
      return "Deposited funds are not accounted for";
  }
  return "unknown ScriptError";
}
