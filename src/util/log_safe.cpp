// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/log_safe.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <utility>

namespace walletsync {
namespace util {

SafeLogger::SafeLogger(std::shared_ptr<spdlog::logger> public_logger,
                       std::shared_ptr<spdlog::logger> secure_logger)
    : public_(std::move(public_logger)), secure_(std::move(secure_logger)) {
  if (!public_ || !secure_) {
    throw std::invalid_argument("SafeLogger requires both public and secure loggers");
  }
}

SafeLogger SafeLogger::ForComponent(const std::string &component) {
  return SafeLogger(LogManager::GetLogger(component), LogManager::GetLogger("secure"));
}

void SafeLogger::Debug(const SafeMessageBuilder &build) const {
  Log(spdlog::level::debug, build);
}

void SafeLogger::Info(const SafeMessageBuilder &build) const {
  Log(spdlog::level::info, build);
}

void SafeLogger::Warn(const SafeMessageBuilder &build) const {
  Log(spdlog::level::warn, build);
}

void SafeLogger::Error(const SafeMessageBuilder &build) const {
  Log(spdlog::level::err, build);
}

void SafeLogger::Log(spdlog::level::level_enum level,
                     const SafeMessageBuilder &build) const {
  // Skip rendering entirely for sinks that would drop the message
  if (secure_->should_log(level)) {
    secure_->log(level, build(SecurityLevel::Secure));
  }
  if (public_->should_log(level)) {
    public_->log(level, build(SecurityLevel::Public));
  }
}

} // namespace util
} // namespace walletsync
