/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"
#include "ics23/ics23_error.hpp"
#include "ics23/proofs.hpp"

namespace merklechain::ics23 {

  outcome::result<common::Buffer> doHash(const crypto::Hasher &hasher,
                                         HashOp op,
                                         common::BufferView data);

  outcome::result<common::Buffer> doLength(LengthOp op,
                                           common::BufferView data);

  /**
   * Computes the leaf hash of the key/value pair
   */
  outcome::result<common::Buffer> applyLeaf(const crypto::Hasher &hasher,
                                            const LeafOp &op,
                                            common::BufferView key,
                                            common::BufferView value);

  /**
   * Computes the parent hash of the child hash
   */
  outcome::result<common::Buffer> applyInner(const crypto::Hasher &hasher,
                                             const InnerOp &op,
                                             common::BufferView child);

  outcome::result<void> checkAgainstSpec(const LeafOp &op,
                                         const ProofSpec &spec);

  outcome::result<void> checkAgainstSpec(const InnerOp &op,
                                         const ProofSpec &spec);

}  // namespace merklechain::ics23
