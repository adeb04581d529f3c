/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/commitment_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::commitment, CommitmentError, e) {
  using E = merklechain::commitment::CommitmentError;
  switch (e) {
    case E::INVALID_PROOF:
      return "Invalid commitment proof";
    case E::EMPTY_PREFIX:
      return "Prefix can't be empty";
    case E::INVALID_PATH:
      return "Path is not well formed";
    case E::NOT_A_MERKLE_PATH:
      return "Path is not a merkle path";
    case E::INVALID_ESCAPE:
      return "Path contains a malformed percent escape";
  }
  return "Unknown CommitmentError";
}
