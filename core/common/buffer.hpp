/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace merklechain::common {

  /**
   * Owning byte string. Keys, values, hashes and prefixes of commitment
   * proofs are all kept in it.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    // Next line is required at least for the scale-codec
    static constexpr bool is_static_collection = false;

    Buffer() = default;

    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end){};

    using Base::Base;
    using Base::operator=;

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      push_back(n);
      return *this;
    }

    /**
     * @brief Put a string into byte buffer
     * @param view arbitrary string
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @param view arbitrary span of bytes
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    BufferView view(size_t offset = 0, size_t length = -1) const {
      return std::span(*this).subspan(offset, length);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    /// Parses lower or upper case hex without the 0x prefix
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    /**
     * @brief return content of bytearray as a string view
     * @note Does not ensure correct encoding
     */
    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string_view(reinterpret_cast<const char *>(data()), size());
    }

    /**
     * @brief stores content of a string to byte array
     */
    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }

    bool operator==(const Buffer &other) const {
      return static_cast<const Base &>(*this)
          == static_cast<const Base &>(other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    /// mind that it does not perform unhexing, there is ""_hex2buf for it
    inline Buffer operator""_buf(const char *c, size_t s) {
      std::vector<uint8_t> chars(c, c + s);
      return Buffer(std::move(chars));
    }

    inline Buffer operator""_hex2buf(const char *hex, size_t size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace merklechain::common

namespace merklechain {
  using common::Buffer;
}  // namespace merklechain

template <>
struct fmt::formatter<merklechain::common::Buffer>
    : fmt::formatter<merklechain::common::BufferView> {};
