/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <numcodec/log/logger.hpp>

#include <mutex>
#include <numcodec/log/simple.hpp>
#include <stdexcept>

namespace numcodec::log {
  namespace {
    std::mutex &systemMutex() {
      static std::mutex mutex;
      return mutex;
    }

    std::shared_ptr<soralog::LoggingSystem> &system() {
      static std::shared_ptr<soralog::LoggingSystem> logging_system;
      return logging_system;
    }

    std::shared_ptr<soralog::LoggingSystem> ensureLoggingSystem() {
      std::lock_guard lock{systemMutex()};
      if (system() == nullptr) {
        auto logsys = std::make_shared<soralog::LoggingSystem>(
            std::make_shared<soralog::ConfiguratorFromYAML>(
                simpleLoggingConfig("info")));
        auto r = logsys->configure();
        if (r.has_error) {
          throw std::logic_error{"numcodec: default logging config rejected: "
                                 + r.message};
        }
        system() = std::move(logsys);
      }
      return system();
    }
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    std::lock_guard lock{systemMutex()};
    system() = std::move(logging_system);
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, kDefaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return ensureLoggingSystem()->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return ensureLoggingSystem()->setLevelOfGroup(group_name, level);
  }
}  // namespace numcodec::log
