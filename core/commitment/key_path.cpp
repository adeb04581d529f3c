/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/key_path.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include "common/hexutil.hpp"
#include "common/uri.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::commitment, KeyPathError, e) {
  using E = merklechain::commitment::KeyPathError;
  switch (e) {
    case E::EMPTY_SEGMENT:
      return "Key path contains an empty segment";
    case E::INVALID_HEX_SEGMENT:
      return "Hex segment of key path is not valid hex";
    case E::INVALID_ESCAPE:
      return "Segment of key path contains a malformed percent escape";
  }
  return "Unknown KeyPathError";
}

namespace merklechain::commitment {

  namespace {
    constexpr std::string_view kHexSegmentPrefix = "x:";
    constexpr char kSeparator = '/';
  }  // namespace

  KeyPath &KeyPath::appendKey(common::BufferView name, KeyEncoding encoding) {
    keys.emplace_back(Key{common::Buffer{name}, encoding});
    return *this;
  }

  std::string KeyPath::toString() const {
    std::string result;
    for (const auto &key : keys) {
      if (&key != &keys.front()) {
        result += kSeparator;
      }
      switch (key.encoding) {
        case KeyEncoding::URL:
          result += common::uriPathEscape(key.name);
          break;
        case KeyEncoding::HEX:
          result += kHexSegmentPrefix;
          result += common::hex_upper(key.name);
          break;
      }
    }
    return result;
  }

  common::Buffer KeyPath::key() const {
    common::Buffer result;
    for (const auto &key : keys) {
      if (&key != &keys.front()) {
        result.putUint8(kSeparator);
      }
      result.put(key.name);
    }
    return result;
  }

  outcome::result<KeyPath> KeyPath::fromString(std::string_view rendered) {
    KeyPath path;
    if (rendered.empty()) {
      return path;
    }
    std::vector<std::string> parts;
    boost::algorithm::split(
        parts, rendered, boost::algorithm::is_any_of(std::string{kSeparator}));
    for (const auto &part : parts) {
      if (part.empty()) {
        return KeyPathError::EMPTY_SEGMENT;
      }
      std::string_view segment{part};
      if (segment.starts_with(kHexSegmentPrefix)) {
        auto bytes = common::unhex(segment.substr(kHexSegmentPrefix.size()));
        if (bytes.has_error()) {
          return KeyPathError::INVALID_HEX_SEGMENT;
        }
        path.appendKey(bytes.value(), KeyEncoding::HEX);
        continue;
      }
      auto name = common::uriPathUnescape(segment);
      if (name.has_error()) {
        return KeyPathError::INVALID_ESCAPE;
      }
      path.appendKey(name.value(), KeyEncoding::URL);
    }
    return path;
  }

}  // namespace merklechain::commitment
