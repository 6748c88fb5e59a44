/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(tagid::log, Error, e) {
  using E = tagid::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
  }
  return "Unknown log::Error";
}

namespace tagid::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "tagid::log::setLoggingSystem() was not called");
      return logging_system;
    }

    std::shared_ptr<soralog::LoggerFactory> loggerFactory() {
      return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem());
    }

    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
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
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<LevelOverride> parseLevelOverride(std::string_view chunk) {
    auto eq = chunk.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(chunk));
      return LevelOverride{defaultGroupName, level};
    }
    auto group = chunk.substr(0, eq);
    if (group.empty()) {
      return Error::WRONG_GROUP;
    }
    OUTCOME_TRY(level, str2lvl(chunk.substr(eq + 1)));
    return LevelOverride{std::string(group), level};
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  void tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = loggingSystem();
    auto logger = createLogger("LoggingTuner");

    for (auto &chunk : cfg) {
      auto res = parseLevelOverride(chunk);
      if (res.has_error()) {
        SL_WARN(logger, "Level override '{}' is skipped: {}", chunk,
                res.error().message());
        continue;
      }
      auto &[group, level] = res.value();
      if (not logging_system->setLevelOfGroup(group, level)) {
        SL_WARN(logger, "Level override '{}' is skipped: {}", chunk,
                make_error_code(Error::WRONG_GROUP).message());
      }
    }
  }

  Logger createLogger(const std::string &tag) {
    return loggerFactory()->getLogger(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return loggerFactory()->getLogger(tag, group);
  }

  Logger createLogger(const std::string &tag,
                      const std::string &group,
                      Level level) {
    return loggerFactory()->getLogger(tag, group, level);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

  bool resetLevelOfGroup(const std::string &group_name) {
    return loggingSystem()->resetLevelOfGroup(group_name);
  }

  bool setLevelOfLogger(const std::string &logger_name, Level level) {
    return loggingSystem()->setLevelOfLogger(logger_name, level);
  }

  bool resetLevelOfLogger(const std::string &logger_name) {
    return loggingSystem()->resetLevelOfLogger(logger_name);
  }

}  // namespace tagid::log
