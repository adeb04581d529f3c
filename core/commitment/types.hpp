/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace merklechain::commitment {

  /**
   * Family of commitment scheme a value belongs to. Values of different
   * families can't be mixed in one verification.
   */
  enum class CommitmentType : uint8_t {
    MERKLE = 1,
  };

  /**
   * Trusted anchor of a commitment, e.g. the app hash of a block header
   */
  class Root {
   public:
    virtual ~Root() = default;

    virtual CommitmentType getCommitmentType() const = 0;

    virtual common::BufferView hash() const = 0;

    virtual bool isEmpty() const = 0;
  };

  /**
   * Namespace prepended to all keys of a store
   */
  class Prefix {
   public:
    virtual ~Prefix() = default;

    virtual CommitmentType getCommitmentType() const = 0;

    virtual common::BufferView bytes() const = 0;

    virtual bool isEmpty() const = 0;
  };

  /**
   * Location of a committed value, from the trust root down to the leaf
   */
  class Path {
   public:
    virtual ~Path() = default;

    virtual CommitmentType getCommitmentType() const = 0;

    virtual std::string toString() const = 0;

    virtual bool isEmpty() const = 0;
  };

  /**
   * Proof of (non-)membership checked against a Root
   */
  class Proof {
   public:
    virtual ~Proof() = default;

    virtual CommitmentType getCommitmentType() const = 0;

    virtual bool isEmpty() const = 0;

    virtual outcome::result<void> validateBasic() const = 0;
  };

}  // namespace merklechain::commitment
