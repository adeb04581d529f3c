/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"

namespace merklechain::crypto {
  class Hasher {
   public:
    virtual ~Hasher() = default;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual common::Buffer sha2_256(common::BufferView data) const = 0;

    /**
     * @brief sha2_512 function calculates 64-byte sha2-512 hash
     * @param data source value
     * @return 512-bit hash value
     */
    virtual common::Buffer sha2_512(common::BufferView data) const = 0;
  };
}  // namespace merklechain::crypto
