/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "commitment/types.hpp"

namespace merklechain::commitment {

  /**
   * Root hash of the outermost tree of a chain of Merkle trees
   */
  class MerkleRoot final : public Root {
   public:
    MerkleRoot() = default;

    explicit MerkleRoot(common::Buffer hash) : hash_{std::move(hash)} {}

    CommitmentType getCommitmentType() const override {
      return CommitmentType::MERKLE;
    }

    common::BufferView hash() const override {
      return hash_;
    }

    bool isEmpty() const override {
      return hash_.empty();
    }

    bool operator==(const MerkleRoot &other) const {
      return hash_ == other.hash_;
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const MerkleRoot &root) {
      return s << root.hash_;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, MerkleRoot &root) {
      return s >> root.hash_;
    }

   private:
    common::Buffer hash_;
  };

}  // namespace merklechain::commitment
