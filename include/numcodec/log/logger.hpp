/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>
#include <string>

namespace numcodec::log {
  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  /// Group every codec logger belongs to
  inline const std::string kDefaultGroupName = "numcodec";

  /**
   * Install the logging system used by `createLogger`.
   * Loggers created before the call keep their old system.
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Logger tagged `tag` in the default group.
   * Installs a console-only logging system on first use if none was set.
   */
  Logger createLogger(const std::string &tag);

  Logger createLogger(const std::string &tag, const std::string &group);

  /// @return false if the group is unknown
  bool setLevelOfGroup(const std::string &group_name, Level level);
}  // namespace numcodec::log
