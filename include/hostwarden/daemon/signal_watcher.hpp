#pragma once

#include "hostwarden/common/cancellation.hpp"
#include "hostwarden/common/result.hpp"

#include <atomic>
#include <thread>

namespace hostwarden::daemon {

/// Turns SIGTERM, SIGINT and SIGHUP into a cancellation of `token`. The signals must be
/// blocked with block_termination_signals() before any other thread starts, so only the
/// watcher thread ever receives them.
class SignalWatcher {
public:
  explicit SignalWatcher(common::CancellationToken &token);
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  [[nodiscard]] static common::Status block_termination_signals();

  void start();
  void stop();

  [[nodiscard]] int received_signal() const { return received_.load(); }

private:
  void watch();

  common::CancellationToken &token_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> finished_{false};
  std::atomic<int> received_{0};
};

} // namespace hostwarden::daemon
