/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <soralog/logging_system.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"

int proof_explorer_main(int argc, const char **argv);

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        merklechain::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto embedded_log_configurator =
        std::make_shared<merklechain::log::Configurator>();

    auto log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<merklechain::log::Configurator>(
                  std::move(embedded_log_configurator),
                  custom_log_config_path.value())
            : std::move(embedded_log_configurator);

    return std::make_shared<soralog::LoggingSystem>(
        std::move(log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  merklechain::log::setLoggingSystem(logging_system);

  int exit_code = proof_explorer_main(argc, argv);

  auto logger = merklechain::log::createLogger(
      "Main", merklechain::log::defaultGroupName);
  SL_TRACE(logger, "Exit with code {}", exit_code);
  logger->flush();

  return exit_code;
}
