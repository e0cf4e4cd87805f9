#pragma once

#include "hostwarden/alerts/cooldown.hpp"
#include "hostwarden/alerts/notifier.hpp"
#include "hostwarden/config/schema.hpp"

#include <functional>
#include <mutex>
#include <string>

namespace hostwarden::journal {
class IncidentJournal;
}

namespace hostwarden::alerts {

struct DispatchSettings {
  bool enabled = true;
  std::string subject_prefix = "[hostwarden]";
  std::string recipient;
  std::string host;
  std::chrono::seconds cooldown{3600};

  [[nodiscard]] static DispatchSettings from_config(const config::Config &config);
};

enum class DispatchOutcome {
  Sent,
  Suppressed,
};

struct DispatchResult {
  DispatchOutcome outcome = DispatchOutcome::Suppressed;
  std::string reason;

  [[nodiscard]] bool sent() const { return outcome == DispatchOutcome::Sent; }
};

using SteadyClockFn = std::function<SteadyTime()>;

/// Cooldown-gated alert fan-out. The notifier and journal are borrowed and must outlive
/// the dispatcher; a null notifier means alerting is off.
class AlertDispatcher {
public:
  AlertDispatcher(DispatchSettings settings, INotifier *notifier,
                  journal::IncidentJournal *journal = nullptr, SteadyClockFn clock = {});

  DispatchResult notify(const std::string &alert_key, const std::string &summary,
                        const std::string &detail);

  [[nodiscard]] const CooldownRegistry &cooldowns() const { return cooldowns_; }
  [[nodiscard]] bool active() const { return settings_.enabled && notifier_ != nullptr; }

private:
  void journal_outcome(const std::string &alert_key, const std::string &outcome,
                       const std::string &summary, const std::string &detail);

  DispatchSettings settings_;
  INotifier *notifier_;
  journal::IncidentJournal *journal_;
  SteadyClockFn clock_;
  CooldownRegistry cooldowns_;
  std::mutex dispatch_mutex_;
};

} // namespace hostwarden::alerts
