/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "ics23/proof_verifier.hpp"

#include <memory>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace merklechain::ics23 {

  class ProofVerifierImpl : public ProofVerifier {
   public:
    explicit ProofVerifierImpl(std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<common::Buffer> calculate(
        const ExistenceProof &proof) const override;

    bool verifyMembership(const ProofSpec &spec,
                          common::BufferView root,
                          const CommitmentProof &proof,
                          common::BufferView key,
                          common::BufferView value) const override;

    bool verifyNonMembership(const ProofSpec &spec,
                             common::BufferView root,
                             const CommitmentProof &proof,
                             common::BufferView key) const override;

    /**
     * Full check of an existence proof, reporting the reason of a failure
     */
    outcome::result<void> verifyExistence(const ExistenceProof &proof,
                                          const ProofSpec &spec,
                                          common::BufferView root,
                                          common::BufferView key,
                                          common::BufferView value) const;

    /**
     * Full check of a non-existence proof, reporting the reason of a failure
     */
    outcome::result<void> verifyNonExistence(const NonExistenceProof &proof,
                                             const ProofSpec &spec,
                                             common::BufferView root,
                                             common::BufferView key) const;

   private:
    outcome::result<void> checkAgainstSpec(const ExistenceProof &proof,
                                           const ProofSpec &spec) const;

    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace merklechain::ics23
