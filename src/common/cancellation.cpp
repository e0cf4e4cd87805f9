#include "hostwarden/common/cancellation.hpp"

namespace hostwarden::common {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::wait_for(const std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

} // namespace hostwarden::common
