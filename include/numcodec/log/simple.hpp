/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <fmt/format.h>
#include <numcodec/log/logger.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <string_view>

namespace numcodec {
  inline std::string simpleLoggingConfig(std::string_view level) {
    return fmt::format(R"(
    sinks:
      - name: console
        type: console
        color: true
        capacity: 4
        latency: 0
    groups:
      - name: main
        sink: console
        level: {}
        is_fallback: true
        children:
          - name: {}
    )",
                       level,
                       log::kDefaultGroupName);
  }

  /**
   * Console logging system from an embedded YAML config.
   * Exits the process if soralog rejects the config.
   */
  inline void simpleLoggingSystem(std::string_view level = "info") {
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<soralog::ConfiguratorFromYAML>(
            simpleLoggingConfig(level)));
    auto r = logsys->configure();
    if (not r.message.empty()) {
      fmt::print(stderr, "soralog error: {}\n", r.message);
    }
    if (r.has_error) {
      exit(EXIT_FAILURE);
    }
    log::setLoggingSystem(logsys);
  }
}  // namespace numcodec
