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

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

// pre-include all formatters
#include "log/formatters/tagged_id.hpp"

namespace tagid::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP };

  static const std::string defaultGroupName("tagid");

  /// Level name or its short form, e.g. "warning" or "warn"
  outcome::result<Level> str2lvl(std::string_view str);

  struct LevelOverride {
    std::string group;
    Level level;
  };

  /**
   * Parses "group=level", a bare level applies to the default group
   */
  outcome::result<LevelOverride> parseLevelOverride(std::string_view chunk);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides in the form accepted by parseLevelOverride,
   * malformed ones and ones of unknown groups are skipped with a warning
   */
  void tuneLoggingSystem(const std::vector<std::string> &cfg);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group,
                                    Level level);

  bool setLevelOfGroup(const std::string &group_name, Level level);
  bool resetLevelOfGroup(const std::string &group_name);

  bool setLevelOfLogger(const std::string &logger_name, Level level);
  bool resetLevelOfLogger(const std::string &logger_name);

}  // namespace tagid::log

OUTCOME_HPP_DECLARE_ERROR(tagid::log, Error);
