/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace merklechain::crypto {
  common::Buffer sha256(std::string_view input) {
    return sha256(common::byteView(input));
  }

  common::Buffer sha256(common::BufferView input) {
    common::Buffer out(SHA256_DIGEST_LENGTH, 0);
    SHA256(input.data(), input.size(), out.data());
    return out;
  }

  common::Buffer sha512(common::BufferView input) {
    common::Buffer out(SHA512_DIGEST_LENGTH, 0);
    SHA512(input.data(), input.size(), out.data());
    return out;
  }
}  // namespace merklechain::crypto
