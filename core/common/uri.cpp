/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri.hpp"

#include <cctype>

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::common, UriError, e) {
  using E = merklechain::common::UriError;
  switch (e) {
    case E::INVALID_ESCAPE:
      return "Invalid percent escape in URI path";
  }
  return "Unknown UriError";
}

namespace merklechain::common {

  namespace {
    constexpr std::string_view kUpperHex = "0123456789ABCDEF";

    /// Separators of a path segment ('/', ';', ',', '?') are escaped
    bool shouldEscape(uint8_t c) {
      if (std::isalnum(c)) {
        return false;
      }
      switch (c) {
        case '-':
        case '_':
        case '.':
        case '~':
        case '$':
        case '&':
        case '+':
        case ':':
        case '=':
        case '@':
          return false;
        default:
          return true;
      }
    }

    int unhexDigit(char c) {
      if (c >= '0' and c <= '9') {
        return c - '0';
      }
      if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
      }
      if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
      }
      return -1;
    }
  }  // namespace

  std::string uriPathEscape(BufferView segment) {
    std::string result;
    result.reserve(segment.size());
    for (auto c : segment) {
      if (shouldEscape(c)) {
        result += '%';
        result += kUpperHex[c >> 4];
        result += kUpperHex[c & 0x0f];
      } else {
        result += static_cast<char>(c);
      }
    }
    return result;
  }

  outcome::result<Buffer> uriPathUnescape(std::string_view escaped) {
    Buffer result;
    result.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
      if (escaped[i] != '%') {
        result.putUint8(static_cast<uint8_t>(escaped[i]));
        continue;
      }
      if (i + 2 >= escaped.size()) {
        return UriError::INVALID_ESCAPE;
      }
      auto hi = unhexDigit(escaped[i + 1]);
      auto lo = unhexDigit(escaped[i + 2]);
      if (hi < 0 or lo < 0) {
        return UriError::INVALID_ESCAPE;
      }
      result.putUint8(static_cast<uint8_t>((hi << 4) | lo));
      i += 2;
    }
    return result;
  }

}  // namespace merklechain::common
