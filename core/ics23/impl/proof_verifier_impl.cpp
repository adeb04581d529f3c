/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ics23/impl/proof_verifier_impl.hpp"

#include <algorithm>
#include <span>

#include <boost/assert.hpp>

#include "ics23/ops.hpp"

namespace merklechain::ics23 {

  namespace {
    using InnerOps = std::span<const InnerOp>;

    struct Padding {
      size_t min_prefix;
      size_t max_prefix;
      size_t suffix;
    };

    std::optional<size_t> getPosition(const std::vector<int32_t> &order,
                                      size_t branch) {
      auto it =
          std::find(order.begin(), order.end(), static_cast<int32_t>(branch));
      if (it == order.end()) {
        return std::nullopt;
      }
      return std::distance(order.begin(), it);
    }

    /// Expected prefix and suffix lengths of an inner op for the branch
    std::optional<Padding> getPadding(const InnerSpec &spec, size_t branch) {
      auto idx = getPosition(spec.child_order, branch);
      if (not idx) {
        return std::nullopt;
      }
      auto child_size = static_cast<size_t>(spec.child_size);
      auto prefix = *idx * child_size;
      return Padding{
          .min_prefix =
              prefix + static_cast<size_t>(spec.min_prefix_length),
          .max_prefix =
              prefix + static_cast<size_t>(spec.max_prefix_length),
          .suffix = (spec.child_order.size() - 1 - *idx) * child_size,
      };
    }

    bool hasPadding(const InnerOp &op, const Padding &padding) {
      return op.prefix.size() >= padding.min_prefix
         and op.prefix.size() <= padding.max_prefix
         and op.suffix.size() == padding.suffix;
    }

    bool allHavePadding(const InnerSpec &spec, InnerOps path, size_t branch) {
      auto padding = getPadding(spec, branch);
      if (not padding) {
        return false;
      }
      return std::all_of(path.begin(), path.end(), [&](const InnerOp &op) {
        return hasPadding(op, *padding);
      });
    }

    bool isLeftMost(const InnerSpec &spec, InnerOps path) {
      return allHavePadding(spec, path, 0);
    }

    bool isRightMost(const InnerSpec &spec, InnerOps path) {
      if (spec.child_order.empty()) {
        return false;
      }
      return allHavePadding(spec, path, spec.child_order.size() - 1);
    }

    /// Branch the inner op was taken from, deduced from its padding
    std::optional<size_t> orderFromPadding(const InnerSpec &spec,
                                           const InnerOp &op) {
      for (size_t branch = 0; branch < spec.child_order.size(); ++branch) {
        auto padding = getPadding(spec, branch);
        if (padding and hasPadding(op, *padding)) {
          return branch;
        }
      }
      return std::nullopt;
    }

    bool isLeftStep(const InnerSpec &spec,
                    const InnerOp &left,
                    const InnerOp &right) {
      auto left_idx = orderFromPadding(spec, left);
      auto right_idx = orderFromPadding(spec, right);
      return left_idx and right_idx and *right_idx == *left_idx + 1;
    }

    /**
     * Paths run from leaf to root, so the common part of two neighbours is a
     * suffix of both. Below the first diverging step the left path must keep
     * to the right edge and the right path to the left edge.
     */
    bool isLeftNeighbor(const InnerSpec &spec, InnerOps left, InnerOps right) {
      while (not left.empty() and not right.empty()) {
        const auto &top_left = left.back();
        const auto &top_right = right.back();
        left = left.first(left.size() - 1);
        right = right.first(right.size() - 1);
        if (top_left.prefix == top_right.prefix
            and top_left.suffix == top_right.suffix) {
          continue;
        }
        return isLeftStep(spec, top_left, top_right)
           and isRightMost(spec, left) and isLeftMost(spec, right);
      }
      return false;
    }

    const ExistenceProof *getExistProofForKey(const CommitmentProof &proof,
                                              common::BufferView key) {
      if (auto exist = std::get_if<ExistenceProof>(&proof)) {
        if (common::BufferView{exist->key} == key) {
          return exist;
        }
      }
      return nullptr;
    }

    const NonExistenceProof *getNonExistProofForKey(
        const CommitmentProof &proof, common::BufferView key) {
      if (auto non_exist = std::get_if<NonExistenceProof>(&proof)) {
        auto is_left = not non_exist->left
                    or common::BufferView{non_exist->left->key} < key;
        auto is_right = not non_exist->right
                     or common::BufferView{non_exist->right->key} > key;
        if (is_left and is_right) {
          return non_exist;
        }
      }
      return nullptr;
    }
  }  // namespace

  ProofVerifierImpl::ProofVerifierImpl(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)},
        logger_{log::createLogger("ProofVerifier", "ics23")} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<common::Buffer> ProofVerifierImpl::calculate(
      const ExistenceProof &proof) const {
    OUTCOME_TRY(res, applyLeaf(*hasher_, proof.leaf, proof.key, proof.value));
    for (const auto &step : proof.path) {
      OUTCOME_TRY(parent, applyInner(*hasher_, step, res));
      res = std::move(parent);
    }
    return res;
  }

  outcome::result<void> ProofVerifierImpl::checkAgainstSpec(
      const ExistenceProof &proof, const ProofSpec &spec) const {
    OUTCOME_TRY(ics23::checkAgainstSpec(proof.leaf, spec));
    auto depth = proof.path.size();
    if (spec.min_depth > 0 and depth < static_cast<size_t>(spec.min_depth)) {
      return Ics23Error::DEPTH_OUT_OF_BOUNDS;
    }
    if (spec.max_depth > 0 and depth > static_cast<size_t>(spec.max_depth)) {
      return Ics23Error::DEPTH_OUT_OF_BOUNDS;
    }
    for (const auto &step : proof.path) {
      OUTCOME_TRY(ics23::checkAgainstSpec(step, spec));
    }
    return outcome::success();
  }

  outcome::result<void> ProofVerifierImpl::verifyExistence(
      const ExistenceProof &proof,
      const ProofSpec &spec,
      common::BufferView root,
      common::BufferView key,
      common::BufferView value) const {
    OUTCOME_TRY(checkAgainstSpec(proof, spec));
    if (common::BufferView{proof.key} != key) {
      return Ics23Error::KEY_MISMATCH;
    }
    if (common::BufferView{proof.value} != value) {
      return Ics23Error::VALUE_MISMATCH;
    }
    OUTCOME_TRY(calculated, calculate(proof));
    if (common::BufferView{calculated} != root) {
      return Ics23Error::ROOT_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> ProofVerifierImpl::verifyNonExistence(
      const NonExistenceProof &proof,
      const ProofSpec &spec,
      common::BufferView root,
      common::BufferView key) const {
    const auto &left = proof.left;
    const auto &right = proof.right;
    if (not left and not right) {
      return Ics23Error::NO_NEIGHBOURS;
    }
    if (left) {
      OUTCOME_TRY(verifyExistence(*left, spec, root, left->key, left->value));
      if (key <= common::BufferView{left->key}) {
        return Ics23Error::KEY_NOT_BETWEEN_NEIGHBOURS;
      }
    }
    if (right) {
      OUTCOME_TRY(
          verifyExistence(*right, spec, root, right->key, right->value));
      if (key >= common::BufferView{right->key}) {
        return Ics23Error::KEY_NOT_BETWEEN_NEIGHBOURS;
      }
    }

    if (not left) {
      if (not isLeftMost(spec.inner_spec, right->path)) {
        return Ics23Error::NOT_LEFT_MOST;
      }
    } else if (not right) {
      if (not isRightMost(spec.inner_spec, left->path)) {
        return Ics23Error::NOT_RIGHT_MOST;
      }
    } else if (not isLeftNeighbor(spec.inner_spec, left->path, right->path)) {
      return Ics23Error::NOT_NEIGHBOURS;
    }
    return outcome::success();
  }

  bool ProofVerifierImpl::verifyMembership(const ProofSpec &spec,
                                           common::BufferView root,
                                           const CommitmentProof &proof,
                                           common::BufferView key,
                                           common::BufferView value) const {
    auto exist = getExistProofForKey(proof, key);
    if (exist == nullptr) {
      SL_TRACE(logger_, "No existence proof for key {}", key);
      return false;
    }
    auto res = verifyExistence(*exist, spec, root, key, value);
    if (res.has_error()) {
      SL_TRACE(logger_,
               "Existence proof for key {} rejected: {}",
               key,
               res.error().message());
      return false;
    }
    return true;
  }

  bool ProofVerifierImpl::verifyNonMembership(const ProofSpec &spec,
                                              common::BufferView root,
                                              const CommitmentProof &proof,
                                              common::BufferView key) const {
    auto non_exist = getNonExistProofForKey(proof, key);
    if (non_exist == nullptr) {
      SL_TRACE(logger_, "No non-existence proof for key {}", key);
      return false;
    }
    auto res = verifyNonExistence(*non_exist, spec, root, key);
    if (res.has_error()) {
      SL_TRACE(logger_,
               "Non-existence proof for key {} rejected: {}",
               key,
               res.error().message());
      return false;
    }
    return true;
  }

}  // namespace merklechain::ics23
