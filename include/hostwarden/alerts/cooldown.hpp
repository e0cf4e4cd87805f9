#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hostwarden::alerts {

using SteadyTime = std::chrono::steady_clock::time_point;

/// Last successful notification per alert key. In memory only, so a restart alerts again.
class CooldownRegistry {
public:
  explicit CooldownRegistry(std::chrono::seconds cooldown);

  [[nodiscard]] bool ready(const std::string &key, SteadyTime now) const;
  [[nodiscard]] std::optional<SteadyTime> last_notified(const std::string &key) const;
  [[nodiscard]] std::chrono::seconds remaining(const std::string &key, SteadyTime now) const;

  void mark_notified(const std::string &key, SteadyTime now);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::chrono::seconds cooldown() const { return cooldown_; }

private:
  std::chrono::seconds cooldown_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SteadyTime> last_notified_;
};

} // namespace hostwarden::alerts
