/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "commitment/merkle_path.hpp"
#include "commitment/merkle_proof.hpp"
#include "ics23/proof_verifier.hpp"
#include "log/logger.hpp"

namespace merklechain::commitment {

  /**
   * Verifies a MerkleProof against a trusted root. Every proof of the chain
   * shows that the root of a subtree is stored in the enclosing tree, the
   * last one is checked against the trusted root.
   */
  class ChainVerifier {
   public:
    struct Config {
      size_t max_chain_length = 16;
    };

    ChainVerifier(std::shared_ptr<const ics23::ProofVerifier> verifier,
                  Config config);

    /**
     * Checks that the value is stored under the path
     * @return INVALID_PROOF on any failure
     */
    outcome::result<void> verifyMembership(const MerkleProof &proof,
                                           const Root &root,
                                           const Path &path,
                                           common::BufferView value) const;

    /**
     * Checks that nothing is stored under the path in the innermost tree,
     * while the innermost tree itself is committed to by the root
     * @return INVALID_PROOF on any failure
     */
    outcome::result<void> verifyNonMembership(const MerkleProof &proof,
                                              const Root &root,
                                              const Path &path) const;

   private:
    /// Checks the shape of the inputs and returns the path as MerklePath
    outcome::result<std::reference_wrapper<const MerklePath>> checkChain(
        const MerkleProof &proof, const Root &root, const Path &path) const;

    /// Proves that value is stored under subpath in the tree of level i
    /// @return root of the tree of level i
    outcome::result<common::Buffer> verifyLevel(const MerkleProof &proof,
                                                size_t i,
                                                const Root &root,
                                                const KeyPath &subpath,
                                                common::BufferView value) const;

    std::shared_ptr<const ics23::ProofVerifier> verifier_;
    Config config_;
    log::Logger logger_;
  };

}  // namespace merklechain::commitment
