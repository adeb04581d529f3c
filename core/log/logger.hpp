/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace merklechain::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    EMPTY_FILTER,
  };

  static const std::string defaultGroupName("merklechain");

  /// Level by its name, short aliases ("warn", "err", "no") are accepted
  outcome::result<Level> str2lvl(std::string_view str);

  /**
   * Installs the process-wide logging system. Must be called once before any
   * logger is created.
   */
  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level filters of the `--log` option. A filter is either
   * "<level>", applied to the root group, or "<group>=<level>". Stops at the
   * first malformed filter; filters before it stay applied.
   */
  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace merklechain::log

OUTCOME_HPP_DECLARE_ERROR(merklechain::log, Error);
