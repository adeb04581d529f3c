/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <scale/enum_traits.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"

/**
 * Proof format of a single Merkle tree, as defined by ICS-23. A value of
 * these types is produced by the store that owns the tree and only read here.
 */
namespace merklechain::ics23 {

  enum class HashOp : uint8_t {
    NO_HASH = 0,
    SHA256 = 1,
    SHA512 = 2,
  };

  enum class LengthOp : uint8_t {
    /// data is used as is
    NO_PREFIX = 0,
    /// protobuf varint of the length is prepended
    VAR_PROTO = 1,
    /// 4-byte big-endian length is prepended
    FIXED32_BIG = 2,
    /// 4-byte little-endian length is prepended
    FIXED32_LITTLE = 3,
    /// data must be exactly 32 bytes, nothing is prepended
    REQUIRE_32_BYTES = 4,
    /// data must be exactly 64 bytes, nothing is prepended
    REQUIRE_64_BYTES = 5,
  };

  /**
   * Hashing of a leaf: hash(prefix || length(prehash(key)) ||
   * length(prehash(value)))
   */
  struct LeafOp {
    SCALE_TIE(5);

    HashOp hash = HashOp::NO_HASH;
    HashOp prehash_key = HashOp::NO_HASH;
    HashOp prehash_value = HashOp::NO_HASH;
    LengthOp length = LengthOp::NO_PREFIX;
    common::Buffer prefix;

    bool operator==(const LeafOp &) const = default;
  };

  /**
   * One step from a child hash to its parent: hash(prefix || child || suffix)
   */
  struct InnerOp {
    SCALE_TIE(3);

    HashOp hash = HashOp::NO_HASH;
    common::Buffer prefix;
    common::Buffer suffix;

    bool operator==(const InnerOp &) const = default;
  };

  /**
   * Proves that the key/value pair is contained in the tree. Inner ops are
   * ordered from the leaf up to the root.
   */
  struct ExistenceProof {
    SCALE_TIE(4);

    common::Buffer key;
    common::Buffer value;
    LeafOp leaf;
    std::vector<InnerOp> path;

    bool operator==(const ExistenceProof &) const = default;
  };

  /**
   * Proves that the key is absent by existence proofs of its closest
   * neighbours. At least one of them is present.
   */
  struct NonExistenceProof {
    SCALE_TIE(3);

    common::Buffer key;
    std::optional<ExistenceProof> left;
    std::optional<ExistenceProof> right;

    bool operator==(const NonExistenceProof &) const = default;
  };

  using CommitmentProof = std::variant<ExistenceProof,     // 0
                                       NonExistenceProof>;  // 1

  /**
   * Layout of inner nodes of a tree
   */
  struct InnerSpec {
    SCALE_TIE(6);

    /// position of each child branch in the preimage of an inner node
    std::vector<int32_t> child_order;
    int32_t child_size = 0;
    int32_t min_prefix_length = 0;
    int32_t max_prefix_length = 0;
    common::Buffer empty_child;
    HashOp hash = HashOp::NO_HASH;

    bool operator==(const InnerSpec &) const = default;
  };

  /**
   * Hashing and encoding rules of one tree. Proofs are checked against it
   * before any hash is compared.
   */
  struct ProofSpec {
    SCALE_TIE(4);

    LeafOp leaf_spec;
    InnerSpec inner_spec;
    /// zero means unlimited
    int32_t max_depth = 0;
    int32_t min_depth = 0;

    bool operator==(const ProofSpec &) const = default;
  };

  /// Spec of an IAVL+ tree (cosmos-sdk store)
  ProofSpec iavlSpec();

  /// Spec of a simple Merkle tree as built by tendermint
  ProofSpec tendermintSpec();

}  // namespace merklechain::ics23

SCALE_DEFINE_ENUM_VALUE_RANGE(merklechain::ics23,
                              HashOp,
                              merklechain::ics23::HashOp::NO_HASH,
                              merklechain::ics23::HashOp::SHA512);

SCALE_DEFINE_ENUM_VALUE_RANGE(merklechain::ics23,
                              LengthOp,
                              merklechain::ics23::LengthOp::NO_PREFIX,
                              merklechain::ics23::LengthOp::REQUIRE_64_BYTES);
