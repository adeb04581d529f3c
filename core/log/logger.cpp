/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(merklechain::log, Error, e) {
  using E = merklechain::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::EMPTY_FILTER:
      return "Empty log filter";
  }
  return "Unknown log::Error";
}

namespace merklechain::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<soralog::LoggingSystem> logging_system_;

    const std::array<std::pair<std::string_view, Level>, 12> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
    }};

    soralog::LoggingSystem &loggingSystem() {
      BOOST_ASSERT_MSG(logging_system_,
                       "merklechain::log::setLoggingSystem() must be called "
                       "before the first logger is created");
      return *logging_system_;
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "no") {
      return Level::OFF;
    }
    for (const auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    auto &system = loggingSystem();
    for (std::string_view filter : filters) {
      if (filter.empty()) {
        return Error::EMPTY_FILTER;
      }
      auto eq = filter.find('=');
      if (eq == std::string_view::npos) {
        OUTCOME_TRY(level, str2lvl(filter));
        system.setLevelOfGroup(defaultGroupName, level);
        continue;
      }
      std::string group{filter.substr(0, eq)};
      if (not system.getGroup(group)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(filter.substr(eq + 1)));
      system.setLevelOfGroup(group, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return static_cast<soralog::LoggerFactory &>(loggingSystem())
        .getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem().setLevelOfGroup(group_name, level);
  }

}  // namespace merklechain::log
