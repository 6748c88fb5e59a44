/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <soralog/logging_system.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace testutil {

  inline std::once_flag initialized;

  // owns the logging system, tagid::log keeps a weak reference only
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  inline std::shared_ptr<soralog::LoggingSystem> logging_system;

  // supposed to be called in SetUpTestCase
  inline void prepareLoggers(soralog::Level level = soralog::Level::INFO) {
    std::call_once(initialized, [] {
      auto testing_log_config = std::string(R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: tagid
        children:
          - name: codec
          - name: example
      - name: testing
        level: trace
)");

      logging_system = std::make_shared<soralog::LoggingSystem>(
          std::make_shared<tagid::log::Configurator>(testing_log_config));
      auto r = logging_system->configure();
      if (r.has_error) {
        throw std::runtime_error("Can't configure logger system: " + r.message);
      }

      tagid::log::setLoggingSystem(logging_system);
    });

    tagid::log::setLevelOfGroup(tagid::log::defaultGroupName, level);
  }
}  // namespace testutil
