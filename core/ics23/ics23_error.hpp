/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace merklechain::ics23 {
  enum class Ics23Error : uint8_t {
    EMPTY_KEY = 1,
    EMPTY_VALUE,
    EMPTY_CHILD,
    UNSUPPORTED_HASH_OP,
    INVALID_DATA_LENGTH,
    LEAF_SPEC_MISMATCH,
    INNER_HASH_MISMATCH,
    INNER_PREFIX_STARTS_WITH_LEAF_PREFIX,
    INNER_PREFIX_LENGTH,
    DEPTH_OUT_OF_BOUNDS,
    KEY_MISMATCH,
    VALUE_MISMATCH,
    ROOT_MISMATCH,
    NO_NEIGHBOURS,
    KEY_NOT_BETWEEN_NEIGHBOURS,
    NOT_LEFT_MOST,
    NOT_RIGHT_MOST,
    NOT_NEIGHBOURS,
  };
}  // namespace merklechain::ics23

OUTCOME_HPP_DECLARE_ERROR(merklechain::ics23, Ics23Error)
