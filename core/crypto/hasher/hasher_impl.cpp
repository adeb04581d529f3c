/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include "crypto/sha/sha256.hpp"

namespace merklechain::crypto {

  common::Buffer HasherImpl::sha2_256(common::BufferView data) const {
    return crypto::sha256(data);
  }

  common::Buffer HasherImpl::sha2_512(common::BufferView data) const {
    return crypto::sha512(data);
  }
}  // namespace merklechain::crypto
