/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string_view>

#include "outcome/outcome.hpp"

namespace merklechain::host {

  enum class PathError : uint8_t {
    EMPTY_PATH = 1,
    EMPTY_ELEMENT,
    INVALID_CHARACTER,
    INVALID_ESCAPE,
  };

  /**
   * Checks the rendered form of a commitment path
   */
  using PathValidator =
      std::function<outcome::result<void>(std::string_view path)>;

  /**
   * Path elements are separated by '/'. Each element is non-empty and built
   * of identifier characters [a-zA-Z0-9._+-#[]<>] and well-formed %XX escapes.
   */
  outcome::result<void> defaultPathValidator(std::string_view path);

}  // namespace merklechain::host

OUTCOME_HPP_DECLARE_ERROR(merklechain::host, PathError)
