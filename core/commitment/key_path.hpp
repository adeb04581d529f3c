/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <scale/enum_traits.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace merklechain::commitment {

  enum class KeyEncoding : uint8_t {
    /// rendered percent-escaped
    URL = 0,
    /// rendered as "x:" followed by uppercase hex
    HEX = 1,
  };

  enum class KeyPathError : uint8_t {
    EMPTY_SEGMENT = 1,
    INVALID_HEX_SEGMENT,
    INVALID_ESCAPE,
  };

  /**
   * Key of a value within one tree, as a sequence of segments
   */
  struct KeyPath {
    SCALE_TIE(1);

    struct Key {
      SCALE_TIE(2);

      common::Buffer name;
      KeyEncoding encoding = KeyEncoding::URL;

      bool operator==(const Key &) const = default;
    };

    std::vector<Key> keys;

    KeyPath &appendKey(common::BufferView name, KeyEncoding encoding);

    bool empty() const {
      return keys.empty();
    }

    /**
     * Segments in their escaped form joined with '/'
     */
    std::string toString() const;

    /**
     * Key the tree stores the value under: raw segment bytes joined with '/'.
     * Segments are not escaped here, so ["a/b"] and ["a", "b"] address the
     * same key; the rendered forms ("a%2Fb" and "a/b") still differ.
     */
    common::Buffer key() const;

    /**
     * Parses the output of toString()
     */
    static outcome::result<KeyPath> fromString(std::string_view rendered);

    bool operator==(const KeyPath &) const = default;
  };

}  // namespace merklechain::commitment

SCALE_DEFINE_ENUM_VALUE_RANGE(merklechain::commitment,
                              KeyEncoding,
                              merklechain::commitment::KeyEncoding::URL,
                              merklechain::commitment::KeyEncoding::HEX);

OUTCOME_HPP_DECLARE_ERROR(merklechain::commitment, KeyPathError)
