/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <qtils/cxx20/lexicographical_compare_three_way.hpp>

#include "common/hexutil.hpp"

namespace merklechain::common {

  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    auto operator<=>(const BufferView &other) const {
      return qtils::cxx20::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    auto operator==(const BufferView &other) const {
      return (*this <=> other) == std::strong_ordering::equal;
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

  inline BufferView byteView(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

  template <typename Super, typename Prefix>
  bool startsWith(const Super &super, const Prefix &prefix) {
    if (std::size(super) >= std::size(prefix)) {
      return std::equal(
          std::begin(prefix), std::end(prefix), std::begin(super));
    }
    return false;
  }
}  // namespace merklechain::common

namespace merklechain {
  using common::BufferView;
}  // namespace merklechain

/// Logs bytes as 0x-prefixed lowercase hex
template <>
struct fmt::formatter<merklechain::common::BufferView>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const merklechain::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    auto hex = view.empty() ? std::string{"<empty>"} : "0x" + view.toHex();
    return fmt::formatter<std::string_view>::format(hex, ctx);
  }
};
