/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <iostream>
#include <optional>

#include <boost/program_options.hpp>

namespace {
  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }
}  // namespace

namespace merklechain::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : AppConfigurationImpl(
            log::createLogger("AppConfiguration", "application")) {}

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {}

  bool AppConfigurationImpl::validate_config() const {
    if (max_chain_length_ == 0) {
      SL_ERROR(logger_, "--max-chain-length must be positive");
      return false;
    }
    if (command_.empty()) {
      SL_ERROR(logger_, "No command given");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lcommitment=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a YAML configuration of logging")
        ;

    po::options_description verification_desc("Verification options");
    verification_desc.add_options()
        ("max-chain-length", po::value<size_t>()->default_value(kDefaultMaxChainLength),
          "maximum number of nested trees a proof may span")
        ;

    po::options_description hidden_desc;
    hidden_desc.add_options()
        ("command", po::value<std::vector<std::string>>(), "command and its arguments")
        ;
    // clang-format on

    desc.add(verification_desc);

    po::options_description all_desc;
    all_desc.add(desc).add(hidden_desc);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all_desc)
                    .positional(positional)
                    .run(),
                vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << "Usage: merklechain [options] <command> [arguments]\n"
                   "Run `merklechain help` for the list of commands\n";
      std::cout << desc << std::endl;
      return false;
    }

    if (auto filters = find_argument<std::vector<std::string>>(vm, "log")) {
      logger_tuning_config_ = std::move(*filters);
    }
    max_chain_length_ = vm["max-chain-length"].as<size_t>();
    if (auto command = find_argument<std::vector<std::string>>(vm, "command")) {
      command_ = std::move(*command);
    }

    return validate_config();
  }

}  // namespace merklechain::application
