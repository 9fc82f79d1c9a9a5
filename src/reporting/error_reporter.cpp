// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "reporting/error_reporter.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace walletsync {
namespace reporting {

FileErrorReporter::FileErrorReporter(std::filesystem::path path,
                                     std::string component)
    : path_(std::move(path)), component_(std::move(component)) {}

void FileErrorReporter::TryReport(const std::string &redacted_message) {
  json record = {{"time", util::GetTime()},
                 {"component", component_},
                 {"message", redacted_message}};

  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("cannot open report file " + path_.string());
  }
  out << record.dump() << '\n';
  if (!out) {
    throw std::runtime_error("failed to write report file " + path_.string());
  }
}

void LoggingErrorReporter::TryReport(const std::string &redacted_message) {
  LOG_APP_ERROR("Report: {}", redacted_message);
}

} // namespace reporting
} // namespace walletsync
