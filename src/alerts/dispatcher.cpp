#include "hostwarden/alerts/dispatcher.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/journal/incident_journal.hpp"
#include "hostwarden/observability/global.hpp"

namespace hostwarden::alerts {

DispatchSettings DispatchSettings::from_config(const config::Config &config) {
  DispatchSettings settings;
  settings.enabled = config.alerts.enabled && config.alerts.backend != "none";
  settings.subject_prefix = config.alerts.subject_prefix;
  settings.recipient = config.alerts.recipient;
  settings.host = common::hostname();
  settings.cooldown = std::chrono::seconds(config.alerts.cooldown_secs);
  return settings;
}

AlertDispatcher::AlertDispatcher(DispatchSettings settings, INotifier *notifier,
                                 journal::IncidentJournal *journal, SteadyClockFn clock)
    : settings_(std::move(settings)), notifier_(notifier), journal_(journal),
      clock_(clock ? std::move(clock) : SteadyClockFn([] { return std::chrono::steady_clock::now(); })),
      cooldowns_(settings_.cooldown) {}

DispatchResult AlertDispatcher::notify(const std::string &alert_key, const std::string &summary,
                                       const std::string &detail) {
  std::lock_guard<std::mutex> lock(dispatch_mutex_);

  if (!active()) {
    observability::log_debug("alerts", alert_key + " not sent: alerting disabled");
    journal_outcome(alert_key, "disabled", summary, detail);
    observability::record_alert(alert_key, "disabled");
    return DispatchResult{.outcome = DispatchOutcome::Suppressed, .reason = "disabled"};
  }

  const SteadyTime now = clock_();
  if (!cooldowns_.ready(alert_key, now)) {
    const auto wait = cooldowns_.remaining(alert_key, now);
    observability::log_info("alerts", alert_key + " suppressed by cooldown (" +
                                          std::to_string(wait.count()) + "s left)");
    journal_outcome(alert_key, "cooldown", summary, detail);
    observability::record_alert(alert_key, "cooldown");
    return DispatchResult{.outcome = DispatchOutcome::Suppressed, .reason = "cooldown"};
  }

  AlertMessage message{.alert_key = alert_key,
                       .subject_prefix = settings_.subject_prefix,
                       .summary = summary,
                       .detail = detail,
                       .recipient = settings_.recipient,
                       .host = settings_.host,
                       .timestamp = common::now_rfc3339()};
  const auto status = notifier_->send(message);
  if (!status.ok()) {
    observability::log_error("alerts", alert_key + " via " + std::string(notifier_->name()) +
                                           " failed: " + status.error());
    journal_outcome(alert_key, "transport_failed", summary, status.error());
    observability::record_alert(alert_key, "transport_failed");
    return DispatchResult{.outcome = DispatchOutcome::Suppressed,
                          .reason = "transport failure: " + status.error()};
  }

  cooldowns_.mark_notified(alert_key, now);
  observability::log_info("alerts", alert_key + " sent via " + std::string(notifier_->name()));
  journal_outcome(alert_key, "sent", summary, detail);
  observability::record_alert(alert_key, "sent");
  return DispatchResult{.outcome = DispatchOutcome::Sent, .reason = ""};
}

void AlertDispatcher::journal_outcome(const std::string &alert_key, const std::string &outcome,
                                      const std::string &summary, const std::string &detail) {
  if (journal_ == nullptr) {
    return;
  }
  const auto status = journal_->record(journal::IncidentRecord{.kind = journal::IncidentKind::Alert,
                                                               .alert_key = alert_key,
                                                               .outcome = outcome,
                                                               .summary = summary,
                                                               .detail = detail});
  if (!status.ok()) {
    observability::log_warn("journal", "could not record " + alert_key + ": " + status.error());
  }
}

} // namespace hostwarden::alerts
