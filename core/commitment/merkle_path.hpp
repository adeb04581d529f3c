/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "commitment/key_path.hpp"
#include "commitment/types.hpp"
#include "host/path_validator.hpp"

namespace merklechain::commitment {

  /**
   * Path to a value stored in a chain of nested trees: one KeyPath per tree,
   * ordered from the outermost tree (closest to the root) to the leaf tree
   */
  class MerklePath final : public Path {
   public:
    MerklePath() = default;

    explicit MerklePath(std::vector<KeyPath> key_paths)
        : key_paths_{std::move(key_paths)} {}

    /**
     * Creates a single-level path, each string becomes one URL-encoded
     * segment
     */
    static MerklePath fromSegments(const std::vector<std::string> &segments);

    CommitmentType getCommitmentType() const override {
      return CommitmentType::MERKLE;
    }

    /**
     * Levels rendered by KeyPath::toString and joined with '/'
     */
    std::string toString() const override;

    /**
     * Rendered path with percent escapes decoded
     * @return INVALID_ESCAPE if the rendering is not valid percent-encoding
     */
    outcome::result<std::string> pretty() const;

    bool isEmpty() const override {
      return key_paths_.empty();
    }

    const std::vector<KeyPath> &keyPaths() const {
      return key_paths_;
    }

    bool operator==(const MerklePath &other) const {
      return key_paths_ == other.key_paths_;
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const MerklePath &path) {
      return s << path.key_paths_;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, MerklePath &path) {
      return s >> path.key_paths_;
    }

   private:
    std::vector<KeyPath> key_paths_;
  };

  /**
   * Builds the full path of a value from the store prefix and the path
   * within the store: the prefix becomes a new outermost level, so the result
   * describes a chained proof. The rendered path must pass the validator.
   * @return path or INVALID_PATH, EMPTY_PREFIX, NOT_A_MERKLE_PATH
   */
  outcome::result<MerklePath> applyPrefix(
      const Prefix &prefix,
      const Path &path,
      const host::PathValidator &validator = host::defaultPathValidator);

}  // namespace merklechain::commitment
