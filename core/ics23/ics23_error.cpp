/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ics23/ics23_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::ics23, Ics23Error, e) {
  using E = merklechain::ics23::Ics23Error;
  switch (e) {
    case E::EMPTY_KEY:
      return "Leaf op needs a non-empty key";
    case E::EMPTY_VALUE:
      return "Leaf op needs a non-empty value";
    case E::EMPTY_CHILD:
      return "Inner op needs a non-empty child hash";
    case E::UNSUPPORTED_HASH_OP:
      return "Hash operation is not supported";
    case E::INVALID_DATA_LENGTH:
      return "Data length does not match the required length";
    case E::LEAF_SPEC_MISMATCH:
      return "Leaf op does not match the proof spec";
    case E::INNER_HASH_MISMATCH:
      return "Inner op hash does not match the proof spec";
    case E::INNER_PREFIX_STARTS_WITH_LEAF_PREFIX:
      return "Inner op prefix starts with the leaf prefix";
    case E::INNER_PREFIX_LENGTH:
      return "Inner op prefix length is out of spec bounds";
    case E::DEPTH_OUT_OF_BOUNDS:
      return "Proof depth is out of spec bounds";
    case E::KEY_MISMATCH:
      return "Proof is for another key";
    case E::VALUE_MISMATCH:
      return "Proof is for another value";
    case E::ROOT_MISMATCH:
      return "Calculated root does not match the expected root";
    case E::NO_NEIGHBOURS:
      return "Non-existence proof has no neighbours";
    case E::KEY_NOT_BETWEEN_NEIGHBOURS:
      return "Key is not between the neighbour keys";
    case E::NOT_LEFT_MOST:
      return "Right neighbour is not the left-most leaf";
    case E::NOT_RIGHT_MOST:
      return "Left neighbour is not the right-most leaf";
    case E::NOT_NEIGHBOURS:
      return "Left and right proofs are not adjacent leaves";
  }
  return "Unknown Ics23Error";
}
