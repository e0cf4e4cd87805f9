#include "hostwarden/alerts/cooldown.hpp"

namespace hostwarden::alerts {

CooldownRegistry::CooldownRegistry(const std::chrono::seconds cooldown) : cooldown_(cooldown) {}

bool CooldownRegistry::ready(const std::string &key, const SteadyTime now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_notified_.find(key);
  return it == last_notified_.end() || now - it->second >= cooldown_;
}

std::optional<SteadyTime> CooldownRegistry::last_notified(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_notified_.find(key);
  if (it == last_notified_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::chrono::seconds CooldownRegistry::remaining(const std::string &key,
                                                 const SteadyTime now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_notified_.find(key);
  if (it == last_notified_.end()) {
    return std::chrono::seconds(0);
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - it->second);
  return elapsed >= cooldown_ ? std::chrono::seconds(0) : cooldown_ - elapsed;
}

void CooldownRegistry::mark_notified(const std::string &key, const SteadyTime now) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_notified_[key] = now;
}

std::size_t CooldownRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_notified_.size();
}

} // namespace hostwarden::alerts
