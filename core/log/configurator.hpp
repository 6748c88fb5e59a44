/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace tagid::log {

  /**
   * Logging configuration in soralog YAML format.
   * Without an explicit config the embedded one is used: console sink on
   * stderr, group "tagid" with children "codec" and "example".
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator();

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::string config);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::filesystem::path path);

    /// Value of --logcfg, other command line arguments are ignored
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace tagid::log
