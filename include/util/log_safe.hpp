// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace walletsync {
namespace util {

/**
 * Redaction-aware logging
 *
 * A message that may carry secret data (wallet ids, addresses, amounts) is
 * described by a builder taking the SecurityLevel it is rendered for:
 *
 *   logger.Warn([&](SecurityLevel sl) {
 *     return fmt::format("Skip wallet #{}", SecretOnly(sl, wallet_id));
 *   });
 *
 * SafeLogger renders the builder twice: with Secure for the secure logger
 * and with Public for the component logger. Call sites never decide which
 * sink sees what.
 */
enum class SecurityLevel { Secure, Public };

inline constexpr const char *kHiddenText = "<hidden>";

// Render `value` only for the secure sink
inline std::string SecretOnly(SecurityLevel sl, const std::string &value) {
  return sl == SecurityLevel::Secure ? value : std::string(kHiddenText);
}

template <typename T>
std::string SecretOnly(SecurityLevel sl, const T &value) {
  return sl == SecurityLevel::Secure ? value.ToString() : std::string(kHiddenText);
}

using SafeMessageBuilder = std::function<std::string(SecurityLevel)>;

class SafeLogger {
public:
  // LIFETIME: both loggers are shared with the caller
  SafeLogger(std::shared_ptr<spdlog::logger> public_logger,
             std::shared_ptr<spdlog::logger> secure_logger);

  // Component logger from LogManager paired with the "secure" logger
  static SafeLogger ForComponent(const std::string &component);

  void Debug(const SafeMessageBuilder &build) const;
  void Info(const SafeMessageBuilder &build) const;
  void Warn(const SafeMessageBuilder &build) const;
  void Error(const SafeMessageBuilder &build) const;

  // Underlying public logger, for messages without secret content
  spdlog::logger &Public() const { return *public_; }
  const std::shared_ptr<spdlog::logger> &PublicPtr() const { return public_; }

private:
  void Log(spdlog::level::level_enum level, const SafeMessageBuilder &build) const;

  std::shared_ptr<spdlog::logger> public_;
  std::shared_ptr<spdlog::logger> secure_;
};

} // namespace util
} // namespace walletsync
