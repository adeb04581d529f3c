/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <scale/scale.hpp>

#include "commitment/types.hpp"
#include "ics23/proofs.hpp"

namespace merklechain::commitment {

  /**
   * Chain of single-tree proofs. Proofs are ordered from the lowest subtree
   * to the outermost tree, each tree root being the value proven by the next
   * proof. Specs are paired with proofs by position.
   *
   * Entries are optional because the proof comes from a remote peer and a
   * missing entry must be rejected rather than be unrepresentable.
   */
  class MerkleProof final : public Proof {
   public:
    using SubProofs = std::vector<std::optional<ics23::CommitmentProof>>;
    using Specs = std::vector<std::optional<ics23::ProofSpec>>;

    MerkleProof() = default;

    MerkleProof(SubProofs proofs, Specs specs)
        : proofs_{std::move(proofs)}, specs_{std::move(specs)} {}

    CommitmentType getCommitmentType() const override {
      return CommitmentType::MERKLE;
    }

    /**
     * @return true if either list is empty or has a missing entry
     */
    bool isEmpty() const override;

    /**
     * @return INVALID_PROOF if the proof is empty or lists are of different
     * length
     */
    outcome::result<void> validateBasic() const override;

    const SubProofs &proofs() const {
      return proofs_;
    }

    const Specs &specs() const {
      return specs_;
    }

    bool operator==(const MerkleProof &other) const {
      return proofs_ == other.proofs_ and specs_ == other.specs_;
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const MerkleProof &proof) {
      return s << proof.proofs_ << proof.specs_;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, MerkleProof &proof) {
      return s >> proof.proofs_ >> proof.specs_;
    }

   private:
    SubProofs proofs_;
    Specs specs_;
  };

}  // namespace merklechain::commitment
