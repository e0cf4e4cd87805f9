#include "hostwarden/daemon/signal_watcher.hpp"

#include "hostwarden/observability/global.hpp"

#include <cstring>

#include <pthread.h>
#include <signal.h>

namespace hostwarden::daemon {

namespace {

// SIGUSR2 only wakes the watcher for stop().
sigset_t watched_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGHUP);
  sigaddset(&set, SIGUSR2);
  return set;
}

} // namespace

SignalWatcher::SignalWatcher(common::CancellationToken &token) : token_(token) {}

SignalWatcher::~SignalWatcher() { stop(); }

common::Status SignalWatcher::block_termination_signals() {
  const sigset_t set = watched_signals();
  const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (rc != 0) {
    return common::Status::error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
  }
  return common::Status::success();
}

void SignalWatcher::start() {
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  finished_ = false;
  thread_ = std::thread([this]() { watch(); });
}

void SignalWatcher::stop() {
  if (!thread_.joinable()) {
    return;
  }
  stopping_ = true;
  if (!finished_) {
    pthread_kill(thread_.native_handle(), SIGUSR2);
  }
  thread_.join();
}

void SignalWatcher::watch() {
  const sigset_t set = watched_signals();
  while (true) {
    int signal_number = 0;
    if (sigwait(&set, &signal_number) != 0) {
      continue;
    }
    if (signal_number == SIGUSR2) {
      if (stopping_) {
        finished_ = true;
        return;
      }
      continue;
    }
    received_ = signal_number;
    observability::log_info("signals", std::string("received ") + strsignal(signal_number) +
                                           ", stopping");
    token_.cancel();
    finished_ = true;
    return;
  }
}

} // namespace hostwarden::daemon
