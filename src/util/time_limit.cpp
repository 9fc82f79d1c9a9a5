// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time_limit.hpp"
#include <system_error>

namespace walletsync {
namespace util {

LongActionWatcher::LongActionWatcher(std::chrono::milliseconds first_warning,
                                     std::string tag,
                                     std::shared_ptr<spdlog::logger> logger,
                                     const ThreadStarter &start_thread)
    : first_warning_(first_warning),
      tag_(std::move(tag)),
      logger_(std::move(logger)),
      started_(std::chrono::steady_clock::now()) {
  if (first_warning_.count() <= 0 || !logger_) {
    return;
  }
  try {
    thread_ = start_thread([this] { WatchLoop(); });
  } catch (const std::system_error &e) {
    logger_->warn("Cannot start watcher for '{}', running unwatched: {}", tag_, e.what());
  }
}

std::thread LongActionWatcher::StartThread(std::function<void()> fn) {
  return std::thread(std::move(fn));
}

LongActionWatcher::~LongActionWatcher() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (warnings_ > 0) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    logger_->info("Action '{}' finished after {} ms", tag_, elapsed.count());
  }
}

int LongActionWatcher::warnings_logged() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return warnings_;
}

void LongActionWatcher::WatchLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  auto wait_for = first_warning_;
  auto deadline = started_ + wait_for;

  while (!cv_.wait_until(lock, deadline, [this] { return finished_; })) {
    ++warnings_;
    logger_->warn("Action '{}' took more than {} ms", tag_, wait_for.count());

    // Geometric back-off: next warning when the total wait has doubled
    wait_for *= 2;
    deadline = started_ + wait_for;
  }
}

} // namespace util
} // namespace walletsync
