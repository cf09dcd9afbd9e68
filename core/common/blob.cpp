/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blindbid::common, BlobError, e) {
  using blindbid::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input string has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace blindbid::common {

  template class Blob<32ul>;

}  // namespace blindbid::common
