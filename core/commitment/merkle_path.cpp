/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commitment/merkle_path.hpp"

#include "commitment/commitment_error.hpp"
#include "common/uri.hpp"

namespace merklechain::commitment {

  MerklePath MerklePath::fromSegments(
      const std::vector<std::string> &segments) {
    KeyPath key_path;
    for (const auto &segment : segments) {
      key_path.appendKey(common::byteView(segment), KeyEncoding::URL);
    }
    return MerklePath{std::vector<KeyPath>{std::move(key_path)}};
  }

  std::string MerklePath::toString() const {
    std::string result;
    for (const auto &key_path : key_paths_) {
      if (&key_path != &key_paths_.front()) {
        result += '/';
      }
      result += key_path.toString();
    }
    return result;
  }

  outcome::result<std::string> MerklePath::pretty() const {
    auto unescaped = common::uriPathUnescape(toString());
    if (unescaped.has_error()) {
      return CommitmentError::INVALID_ESCAPE;
    }
    return std::string{unescaped.value().asString()};
  }

  outcome::result<MerklePath> applyPrefix(const Prefix &prefix,
                                          const Path &path,
                                          const host::PathValidator &validator) {
    if (validator(path.toString()).has_error()) {
      return CommitmentError::INVALID_PATH;
    }
    if (prefix.isEmpty()) {
      return CommitmentError::EMPTY_PREFIX;
    }
    const auto *merkle_path = dynamic_cast<const MerklePath *>(&path);
    if (merkle_path == nullptr) {
      return CommitmentError::NOT_A_MERKLE_PATH;
    }

    KeyPath prefix_path;
    prefix_path.appendKey(prefix.bytes(), KeyEncoding::URL);

    std::vector<KeyPath> key_paths;
    key_paths.reserve(merkle_path->keyPaths().size() + 1);
    key_paths.emplace_back(std::move(prefix_path));
    key_paths.insert(key_paths.end(),
                     merkle_path->keyPaths().begin(),
                     merkle_path->keyPaths().end());
    return MerklePath{std::move(key_paths)};
  }

}  // namespace merklechain::commitment
