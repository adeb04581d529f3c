/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"

namespace merklechain::common {

  enum class UriError : uint8_t {
    INVALID_ESCAPE = 1,
  };

  /**
   * Percent-encodes bytes as a single URI path segment. Unreserved
   * characters and the sub-delimiters "$&+:=@" stay as they are, segment
   * separators ("/;,?") and everything else become uppercase %XX.
   */
  std::string uriPathEscape(BufferView segment);

  /**
   * Reverts uriPathEscape. '+' is kept as is.
   * @return decoded bytes or INVALID_ESCAPE if some '%' is not followed by
   * two hex digits
   */
  outcome::result<Buffer> uriPathUnescape(std::string_view escaped);

}  // namespace merklechain::common

OUTCOME_HPP_DECLARE_ERROR(merklechain::common, UriError)
