/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ics23/ops.hpp"

namespace merklechain::ics23 {

  namespace {
    void putVarint(common::Buffer &out, uint64_t n) {
      while (n >= 0x80) {
        out.putUint8(static_cast<uint8_t>(n) | 0x80);
        n >>= 7;
      }
      out.putUint8(static_cast<uint8_t>(n));
    }

    outcome::result<common::Buffer> prepareLeafData(
        const crypto::Hasher &hasher,
        HashOp prehash,
        LengthOp length,
        common::BufferView data) {
      OUTCOME_TRY(hashed, doHash(hasher, prehash, data));
      return doLength(length, hashed);
    }
  }  // namespace

  ProofSpec iavlSpec() {
    return ProofSpec{
        .leaf_spec =
            LeafOp{
                .hash = HashOp::SHA256,
                .prehash_key = HashOp::NO_HASH,
                .prehash_value = HashOp::SHA256,
                .length = LengthOp::VAR_PROTO,
                .prefix = common::Buffer{0},
            },
        .inner_spec =
            InnerSpec{
                .child_order = {0, 1},
                .child_size = 33,
                .min_prefix_length = 4,
                .max_prefix_length = 12,
                .empty_child = {},
                .hash = HashOp::SHA256,
            },
        .max_depth = 0,
        .min_depth = 0,
    };
  }

  ProofSpec tendermintSpec() {
    return ProofSpec{
        .leaf_spec =
            LeafOp{
                .hash = HashOp::SHA256,
                .prehash_key = HashOp::NO_HASH,
                .prehash_value = HashOp::SHA256,
                .length = LengthOp::VAR_PROTO,
                .prefix = common::Buffer{0},
            },
        .inner_spec =
            InnerSpec{
                .child_order = {0, 1},
                .child_size = 32,
                .min_prefix_length = 1,
                .max_prefix_length = 1,
                .empty_child = {},
                .hash = HashOp::SHA256,
            },
        .max_depth = 0,
        .min_depth = 0,
    };
  }

  outcome::result<common::Buffer> doHash(const crypto::Hasher &hasher,
                                         HashOp op,
                                         common::BufferView data) {
    switch (op) {
      case HashOp::NO_HASH:
        return common::Buffer{data};
      case HashOp::SHA256:
        return hasher.sha2_256(data);
      case HashOp::SHA512:
        return hasher.sha2_512(data);
    }
    return Ics23Error::UNSUPPORTED_HASH_OP;
  }

  outcome::result<common::Buffer> doLength(LengthOp op,
                                           common::BufferView data) {
    common::Buffer out;
    switch (op) {
      case LengthOp::NO_PREFIX:
        break;
      case LengthOp::VAR_PROTO:
        putVarint(out, data.size());
        break;
      case LengthOp::FIXED32_BIG: {
        auto n = static_cast<uint32_t>(data.size());
        out.putUint8(n >> 24).putUint8(n >> 16).putUint8(n >> 8).putUint8(n);
        break;
      }
      case LengthOp::FIXED32_LITTLE: {
        auto n = static_cast<uint32_t>(data.size());
        out.putUint8(n).putUint8(n >> 8).putUint8(n >> 16).putUint8(n >> 24);
        break;
      }
      case LengthOp::REQUIRE_32_BYTES:
        if (data.size() != 32) {
          return Ics23Error::INVALID_DATA_LENGTH;
        }
        break;
      case LengthOp::REQUIRE_64_BYTES:
        if (data.size() != 64) {
          return Ics23Error::INVALID_DATA_LENGTH;
        }
        break;
    }
    out.put(data);
    return out;
  }

  outcome::result<common::Buffer> applyLeaf(const crypto::Hasher &hasher,
                                            const LeafOp &op,
                                            common::BufferView key,
                                            common::BufferView value) {
    if (key.empty()) {
      return Ics23Error::EMPTY_KEY;
    }
    if (value.empty()) {
      return Ics23Error::EMPTY_VALUE;
    }
    OUTCOME_TRY(pkey, prepareLeafData(hasher, op.prehash_key, op.length, key));
    OUTCOME_TRY(pvalue,
                prepareLeafData(hasher, op.prehash_value, op.length, value));

    common::Buffer data;
    data.reserve(op.prefix.size() + pkey.size() + pvalue.size());
    data.put(op.prefix).put(pkey).put(pvalue);
    return doHash(hasher, op.hash, data);
  }

  outcome::result<common::Buffer> applyInner(const crypto::Hasher &hasher,
                                             const InnerOp &op,
                                             common::BufferView child) {
    if (child.empty()) {
      return Ics23Error::EMPTY_CHILD;
    }
    common::Buffer preimage;
    preimage.reserve(op.prefix.size() + child.size() + op.suffix.size());
    preimage.put(op.prefix).put(child).put(op.suffix);
    return doHash(hasher, op.hash, preimage);
  }

  outcome::result<void> checkAgainstSpec(const LeafOp &op,
                                         const ProofSpec &spec) {
    const auto &lspec = spec.leaf_spec;
    if (op.hash != lspec.hash or op.prehash_key != lspec.prehash_key
        or op.prehash_value != lspec.prehash_value
        or op.length != lspec.length) {
      return Ics23Error::LEAF_SPEC_MISMATCH;
    }
    if (not common::startsWith(op.prefix, lspec.prefix)) {
      return Ics23Error::LEAF_SPEC_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> checkAgainstSpec(const InnerOp &op,
                                         const ProofSpec &spec) {
    const auto &ispec = spec.inner_spec;
    if (op.hash != ispec.hash) {
      return Ics23Error::INNER_HASH_MISMATCH;
    }
    if (common::startsWith(op.prefix, spec.leaf_spec.prefix)) {
      return Ics23Error::INNER_PREFIX_STARTS_WITH_LEAF_PREFIX;
    }
    if (ispec.child_order.empty()
        or op.prefix.size() < static_cast<size_t>(ispec.min_prefix_length)) {
      return Ics23Error::INNER_PREFIX_LENGTH;
    }
    auto max_left_child_bytes =
        (ispec.child_order.size() - 1) * static_cast<size_t>(ispec.child_size);
    if (op.prefix.size()
        > static_cast<size_t>(ispec.max_prefix_length) + max_left_child_bytes) {
      return Ics23Error::INNER_PREFIX_LENGTH;
    }
    return outcome::success();
  }

}  // namespace merklechain::ics23
