/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/chain_verifier.hpp"

#include <boost/assert.hpp>

#include "commitment/commitment_error.hpp"

namespace merklechain::commitment {

  ChainVerifier::ChainVerifier(
      std::shared_ptr<const ics23::ProofVerifier> verifier, Config config)
      : verifier_{std::move(verifier)},
        config_{config},
        logger_{log::createLogger("ChainVerifier", "commitment")} {
    BOOST_ASSERT(verifier_ != nullptr);
  }

  outcome::result<std::reference_wrapper<const MerklePath>>
  ChainVerifier::checkChain(const MerkleProof &proof,
                            const Root &root,
                            const Path &path) const {
    if (proof.validateBasic().has_error()) {
      SL_DEBUG(logger_, "Malformed proof");
      return CommitmentError::INVALID_PROOF;
    }
    if (root.isEmpty() or path.isEmpty()) {
      SL_DEBUG(logger_, "Empty root or path");
      return CommitmentError::INVALID_PROOF;
    }
    const auto *merkle_path = dynamic_cast<const MerklePath *>(&path);
    if (merkle_path == nullptr) {
      SL_DEBUG(logger_, "Path {} is not a merkle path", path.toString());
      return CommitmentError::INVALID_PROOF;
    }
    auto levels = merkle_path->keyPaths().size();
    if (proof.proofs().size() != levels) {
      SL_DEBUG(logger_,
               "Proof has {} levels, path {} has {}",
               proof.proofs().size(),
               path.toString(),
               levels);
      return CommitmentError::INVALID_PROOF;
    }
    if (levels > config_.max_chain_length) {
      SL_DEBUG(logger_,
               "Chain of {} levels exceeds maximum of {}",
               levels,
               config_.max_chain_length);
      return CommitmentError::INVALID_PROOF;
    }
    return std::cref(*merkle_path);
  }

  outcome::result<common::Buffer> ChainVerifier::verifyLevel(
      const MerkleProof &proof,
      size_t i,
      const Root &root,
      const KeyPath &subpath,
      common::BufferView value) const {
    const auto &sub_proof = *proof.proofs()[i];
    const auto *existence = std::get_if<ics23::ExistenceProof>(&sub_proof);
    if (existence == nullptr) {
      SL_DEBUG(logger_, "Proof of level {} is not an existence proof", i);
      return CommitmentError::INVALID_PROOF;
    }
    auto subroot_res = verifier_->calculate(*existence);
    if (subroot_res.has_error()) {
      SL_DEBUG(logger_,
               "Can't calculate root of level {}: {}",
               i,
               subroot_res.error().message());
      return CommitmentError::INVALID_PROOF;
    }
    auto &subroot = subroot_res.value();

    // the outermost tree is anchored to the trusted root
    auto is_last = i + 1 == proof.proofs().size();
    auto anchor = is_last ? root.hash() : common::BufferView{subroot};
    if (not verifier_->verifyMembership(
            *proof.specs()[i], anchor, sub_proof, subpath.key(), value)) {
      SL_DEBUG(logger_,
               "Membership of {} at level {} not proven",
               subpath.toString(),
               i);
      return CommitmentError::INVALID_PROOF;
    }
    return std::move(subroot);
  }

  outcome::result<void> ChainVerifier::verifyMembership(
      const MerkleProof &proof,
      const Root &root,
      const Path &path,
      common::BufferView value) const {
    if (value.empty()) {
      SL_DEBUG(logger_, "Empty value");
      return CommitmentError::INVALID_PROOF;
    }
    OUTCOME_TRY(merkle_path, checkChain(proof, root, path));
    const auto &key_paths = merkle_path.get().keyPaths();
    auto n = key_paths.size();

    common::Buffer current{value};
    for (size_t i = 0; i < n; ++i) {
      OUTCOME_TRY(subroot,
                  verifyLevel(proof, i, root, key_paths[n - 1 - i], current));
      current = std::move(subroot);
    }
    SL_TRACE(logger_, "Membership of {} proven", path.toString());
    return outcome::success();
  }

  outcome::result<void> ChainVerifier::verifyNonMembership(
      const MerkleProof &proof, const Root &root, const Path &path) const {
    OUTCOME_TRY(merkle_path, checkChain(proof, root, path));
    const auto &key_paths = merkle_path.get().keyPaths();
    auto n = key_paths.size();

    const auto &first = *proof.proofs()[0];
    const auto *absence = std::get_if<ics23::NonExistenceProof>(&first);
    if (absence == nullptr) {
      SL_DEBUG(logger_, "Proof of level 0 is not a non-existence proof");
      return CommitmentError::INVALID_PROOF;
    }
    if (not absence->left.has_value()) {
      SL_DEBUG(logger_, "Non-existence proof has no left neighbour");
      return CommitmentError::INVALID_PROOF;
    }
    auto subroot_res = verifier_->calculate(*absence->left);
    if (subroot_res.has_error()) {
      SL_DEBUG(logger_,
               "Can't calculate root of level 0: {}",
               subroot_res.error().message());
      return CommitmentError::INVALID_PROOF;
    }
    common::Buffer current = std::move(subroot_res.value());

    const auto &subpath = key_paths[n - 1];
    auto anchor = n == 1 ? root.hash() : common::BufferView{current};
    if (not verifier_->verifyNonMembership(
            *proof.specs()[0], anchor, first, subpath.key())) {
      SL_DEBUG(logger_, "Absence of {} not proven", subpath.toString());
      return CommitmentError::INVALID_PROOF;
    }

    for (size_t i = 1; i < n; ++i) {
      OUTCOME_TRY(subroot,
                  verifyLevel(proof, i, root, key_paths[n - 1 - i], current));
      current = std::move(subroot);
    }
    SL_TRACE(logger_, "Non-membership of {} proven", path.toString());
    return outcome::success();
  }

}  // namespace merklechain::commitment
