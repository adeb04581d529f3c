/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ics23/proofs.hpp"
#include "outcome/outcome.hpp"

namespace merklechain::ics23 {

  /**
   * Verification of proofs against the root of a single Merkle tree
   */
  class ProofVerifier {
   public:
    virtual ~ProofVerifier() = default;

    /**
     * Recomputes the root of the tree the existence proof was made for
     * @param proof existence proof of some key/value pair
     * @return root hash or an error if the proof can't be hashed
     */
    virtual outcome::result<common::Buffer> calculate(
        const ExistenceProof &proof) const = 0;

    /**
     * Checks that the key/value pair is contained in the tree with given root
     * @param spec layout of the tree
     * @param root expected root hash
     * @param proof proof which must contain an existence proof for the key
     * @param key key of the leaf
     * @param value value of the leaf
     * @return true iff the proof is valid
     */
    virtual bool verifyMembership(const ProofSpec &spec,
                                  common::BufferView root,
                                  const CommitmentProof &proof,
                                  common::BufferView key,
                                  common::BufferView value) const = 0;

    /**
     * Checks that the key is absent from the tree with given root
     * @param spec layout of the tree
     * @param root expected root hash
     * @param proof proof which must contain a non-existence proof for the key
     * @param key key to be proven absent
     * @return true iff the proof is valid
     */
    virtual bool verifyNonMembership(const ProofSpec &spec,
                                     common::BufferView root,
                                     const CommitmentProof &proof,
                                     common::BufferView key) const = 0;
  };

}  // namespace merklechain::ics23
