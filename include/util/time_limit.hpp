// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <utility>

namespace walletsync {
namespace util {

/**
 * Advisory overrun detector for a long-running action
 *
 * While alive, a background thread waits for `first_warning`; if the owner
 * has not finished by then it logs a warning tagged with `tag` and keeps
 * waiting, logging again each time the total waited time doubles. It never
 * interrupts the watched work. Destruction marks the action finished and
 * joins the thread.
 *
 * A non-positive `first_warning` disables the watcher (no thread is started).
 * If the watch thread cannot be started the failure is logged and the action
 * runs unwatched.
 */
class LongActionWatcher {
public:
  using ThreadStarter = std::function<std::thread(std::function<void()>)>;

  LongActionWatcher(std::chrono::milliseconds first_warning, std::string tag,
                    std::shared_ptr<spdlog::logger> logger,
                    const ThreadStarter &start_thread = StartThread);
  ~LongActionWatcher();

  LongActionWatcher(const LongActionWatcher &) = delete;
  LongActionWatcher &operator=(const LongActionWatcher &) = delete;

  // Number of warnings logged so far
  int warnings_logged() const;

  bool watching() const { return thread_.joinable(); }

  static std::thread StartThread(std::function<void()> fn);

private:
  void WatchLoop();

  const std::chrono::milliseconds first_warning_;
  const std::string tag_;
  std::shared_ptr<spdlog::logger> logger_;
  const std::chrono::steady_clock::time_point started_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool finished_{false};
  int warnings_{0};

  std::thread thread_;
};

/**
 * Run `action` under a LongActionWatcher and return its result.
 * Exceptions from `action` propagate unchanged; the watcher is stopped
 * either way.
 */
template <typename F>
auto LogWarningWaitInf(std::chrono::milliseconds first_warning,
                       const std::string &tag,
                       std::shared_ptr<spdlog::logger> logger, F &&action)
    -> decltype(action()) {
  LongActionWatcher watcher(first_warning, tag, std::move(logger));
  return std::forward<F>(action)();
}

} // namespace util
} // namespace walletsync
