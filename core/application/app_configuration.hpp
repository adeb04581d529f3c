/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace merklechain::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    static constexpr size_t kDefaultMaxChainLength = 16;

    virtual ~AppConfiguration() = default;

    /**
     * @return logging filters given as "level" or "group=level"
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return maximum number of levels a chained proof may have
     */
    virtual size_t maxChainLength() const = 0;

    /**
     * @return command name followed by its arguments
     */
    virtual const std::vector<std::string> &command() const = 0;
  };

}  // namespace merklechain::application
