// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace walletsync {
namespace reporting {

// External sink for failure reports. Messages handed to TryReport must
// already be redacted (rendered with SecurityLevel::Public).
// Implementations may throw; callers treat reporting as best-effort.
class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;
  virtual void TryReport(const std::string &redacted_message) = 0;
};

// Appends one JSON object per line: {"time", "component", "message"}
class FileErrorReporter : public ErrorReporter {
public:
  explicit FileErrorReporter(std::filesystem::path path,
                             std::string component = "wallet");

  // @throws std::runtime_error if the report file cannot be written
  void TryReport(const std::string &redacted_message) override;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  std::string component_;
  std::mutex mutex_;
};

// Reports to the "app" log at error level (used when no report file is set)
class LoggingErrorReporter : public ErrorReporter {
public:
  void TryReport(const std::string &redacted_message) override;
};

} // namespace reporting
} // namespace walletsync
