/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host/path_validator.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <cctype>
#include <string>
#include <vector>

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::host, PathError, e) {
  using E = merklechain::host::PathError;
  switch (e) {
    case E::EMPTY_PATH:
      return "Path is empty";
    case E::EMPTY_ELEMENT:
      return "Path contains an empty element";
    case E::INVALID_CHARACTER:
      return "Path element contains an invalid character";
    case E::INVALID_ESCAPE:
      return "Path element contains a malformed percent escape";
  }
  return "Unknown PathError";
}

namespace merklechain::host {

  namespace {
    bool isIdentifierChar(char c) {
      if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
      }
      switch (c) {
        case '.':
        case '_':
        case '+':
        case '-':
        case '#':
        case '[':
        case ']':
        case '<':
        case '>':
          return true;
        default:
          return false;
      }
    }

    outcome::result<void> validateElement(std::string_view element) {
      if (element.empty()) {
        return PathError::EMPTY_ELEMENT;
      }
      for (size_t i = 0; i < element.size(); ++i) {
        auto c = element[i];
        if (c == '%') {
          if (i + 2 >= element.size()) {
            return PathError::INVALID_ESCAPE;
          }
          if (not std::isxdigit(static_cast<unsigned char>(element[i + 1]))
              or not std::isxdigit(
                  static_cast<unsigned char>(element[i + 2]))) {
            return PathError::INVALID_ESCAPE;
          }
          i += 2;
          continue;
        }
        if (not isIdentifierChar(c)) {
          return PathError::INVALID_CHARACTER;
        }
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<void> defaultPathValidator(std::string_view path) {
    if (path.empty()) {
      return PathError::EMPTY_PATH;
    }
    std::vector<std::string> elements;
    boost::algorithm::split(
        elements, path, boost::algorithm::is_any_of("/"));
    for (const auto &element : elements) {
      OUTCOME_TRY(validateElement(element));
    }
    return outcome::success();
  }

}  // namespace merklechain::host
