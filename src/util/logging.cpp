// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace walletsync {
namespace util {

namespace {

constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

std::once_flag s_init_flag;

// Protects s_loggers (all reads and writes)
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

const std::vector<std::string> kPublicComponents = {"default", "wallet", "chain",
                                                    "slotting", "app"};

void EnsureParentDirectory(const std::filesystem::path &p) {
  if (p.has_parent_path() && !p.parent_path().empty()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory " << p.parent_path()
                << ": " << ec.message() << "\n";
    }
  }
}

spdlog::sink_ptr MakeConsoleSink() {
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(kPattern);
  return console_sink;
}

spdlog::sink_ptr MakeFileSink(const std::string &path) {
  std::filesystem::path p(path);
  EnsureParentDirectory(p);
  auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      p.string(), kMaxLogFileSize, kMaxLogFiles);
  file_sink->set_pattern(kPattern);
  return file_sink;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path,
                        const std::string &secure_log_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    if (log_to_file) {
      try {
        sinks.push_back(MakeFileSink(log_file_path.empty() ? "walletsync.log"
                                                           : log_file_path));
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
        sinks.push_back(MakeConsoleSink());
      }
    } else {
      sinks.push_back(MakeConsoleSink());
    }

    spdlog::sink_ptr secure_sink;
    if (!secure_log_path.empty()) {
      try {
        secure_sink = MakeFileSink(secure_log_path);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize secure logger (" << ex.what()
                  << "), secure messages will be dropped\n";
      }
    }
    if (!secure_sink) {
      secure_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    }

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    const auto level = spdlog::level::from_str(log_level);
    for (const auto &component : kPublicComponents) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(level);
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    auto secure = std::make_shared<spdlog::logger>("secure", secure_sink);
    secure->set_level(level);
    secure->flush_on(spdlog::level::warn);
    spdlog::register_logger(secure);
    s_loggers["secure"] = secure;

    spdlog::set_default_logger(s_loggers["default"]);

    if (log_level != "off") {
      s_loggers["default"]->info("Logging system initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path,
                            const std::string &secure_log_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path, secure_log_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: install a silent console logger
  // so callers never receive nullptr.
  if (s_loggers.empty()) {
    auto logger = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  if (s_loggers.count("default") > 0 && level != "off") {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  if (s_loggers.empty()) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
    if (s_loggers.count("default") > 0 && level != "off") {
      s_loggers["default"]->info("Component '{}' log level set to: {}", component, level);
    }
  } else if (s_loggers.count("default") > 0 &&
             s_loggers["default"]->level() != spdlog::level::off) {
    s_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace walletsync
