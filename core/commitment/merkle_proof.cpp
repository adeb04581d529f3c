/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/merkle_proof.hpp"

#include <algorithm>

#include "commitment/commitment_error.hpp"

namespace merklechain::commitment {

  bool MerkleProof::isEmpty() const {
    if (proofs_.empty() or specs_.empty()) {
      return true;
    }
    auto is_null = [](const auto &entry) { return not entry.has_value(); };
    return std::any_of(proofs_.begin(), proofs_.end(), is_null)
        or std::any_of(specs_.begin(), specs_.end(), is_null);
  }

  outcome::result<void> MerkleProof::validateBasic() const {
    if (isEmpty() or proofs_.size() != specs_.size()) {
      return CommitmentError::INVALID_PROOF;
    }
    return outcome::success();
  }

}  // namespace merklechain::commitment
