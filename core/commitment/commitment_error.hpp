/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace merklechain::commitment {
  enum class CommitmentError : uint8_t {
    INVALID_PROOF = 1,
    EMPTY_PREFIX,
    INVALID_PATH,
    NOT_A_MERKLE_PATH,
    INVALID_ESCAPE,
  };
}  // namespace merklechain::commitment

OUTCOME_HPP_DECLARE_ERROR(merklechain::commitment, CommitmentError)
