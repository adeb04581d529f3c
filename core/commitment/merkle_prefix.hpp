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
   * Store prefix, it becomes the outermost level of a path built by
   * applyPrefix
   */
  class MerklePrefix final : public Prefix {
   public:
    MerklePrefix() = default;

    explicit MerklePrefix(common::Buffer key_prefix)
        : key_prefix_{std::move(key_prefix)} {}

    CommitmentType getCommitmentType() const override {
      return CommitmentType::MERKLE;
    }

    common::BufferView bytes() const override {
      return key_prefix_;
    }

    bool isEmpty() const override {
      return key_prefix_.empty();
    }

    bool operator==(const MerklePrefix &other) const {
      return key_prefix_ == other.key_prefix_;
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const MerklePrefix &prefix) {
      return s << prefix.key_prefix_;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, MerklePrefix &prefix) {
      return s >> prefix.key_prefix_;
    }

   private:
    common::Buffer key_prefix_;
  };

}  // namespace merklechain::commitment
