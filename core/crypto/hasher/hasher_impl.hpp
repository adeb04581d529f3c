/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace merklechain::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    common::Buffer sha2_256(common::BufferView data) const override;

    common::Buffer sha2_512(common::BufferView data) const override;
  };

}  // namespace merklechain::crypto
