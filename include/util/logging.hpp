// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace walletsync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to per-component
 * loggers. Public components ("default", "wallet", "chain", "slotting",
 * "app") share the console or rotating file sinks. The "secure" logger
 * receives the unredacted rendering of wallet messages and only ever writes
 * to its own file (see SafeLogger in util/log_safe.hpp).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log public components to file instead of
   * the console
   * @param log_file_path Path to log file (if log_to_file is true)
   * @param secure_log_path Path to the secure log file. Empty disables the
   * secure sink (secure messages are dropped).
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "walletsync.log",
                         const std::string &secure_log_path = "");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "wallet", "chain", "secure")
   *
   * Auto-initializes if not initialized. Unknown names return the default
   * logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all public components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace walletsync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  walletsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  walletsync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  walletsync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  walletsync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  walletsync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_WALLET_TRACE(...)                                                  \
  walletsync::util::LogManager::GetLogger("wallet")->trace(__VA_ARGS__)
#define LOG_WALLET_DEBUG(...)                                                  \
  walletsync::util::LogManager::GetLogger("wallet")->debug(__VA_ARGS__)
#define LOG_WALLET_INFO(...)                                                   \
  walletsync::util::LogManager::GetLogger("wallet")->info(__VA_ARGS__)
#define LOG_WALLET_WARN(...)                                                   \
  walletsync::util::LogManager::GetLogger("wallet")->warn(__VA_ARGS__)
#define LOG_WALLET_ERROR(...)                                                  \
  walletsync::util::LogManager::GetLogger("wallet")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  walletsync::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  walletsync::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  walletsync::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  walletsync::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  walletsync::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_SLOTTING_DEBUG(...)                                                \
  walletsync::util::LogManager::GetLogger("slotting")->debug(__VA_ARGS__)
#define LOG_SLOTTING_WARN(...)                                                 \
  walletsync::util::LogManager::GetLogger("slotting")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  walletsync::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  walletsync::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  walletsync::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
