#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hostwarden::common {

class CancellationToken {
public:
  void cancel();
  [[nodiscard]] bool cancelled() const;

  /// Sleeps for up to `duration`. Returns false when woken by cancel().
  bool wait_for(std::chrono::milliseconds duration);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace hostwarden::common
