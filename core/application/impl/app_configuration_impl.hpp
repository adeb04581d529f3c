/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

namespace merklechain::application {

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    AppConfigurationImpl();
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * Parses command line options, everything that is not an option is
     * collected as the command
     * @return true if the application may run with parsed configuration
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    size_t maxChainLength() const override {
      return max_chain_length_;
    }

    const std::vector<std::string> &command() const override {
      return command_;
    }

   private:
    bool validate_config() const;

    log::Logger logger_;

    std::vector<std::string> logger_tuning_config_;
    size_t max_chain_length_ = kDefaultMaxChainLength;
    std::vector<std::string> command_;
  };

}  // namespace merklechain::application
