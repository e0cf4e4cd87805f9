#include "hostwarden/alerts/notifier.hpp"

#include "hostwarden/common/json_util.hpp"

#include <sstream>

namespace hostwarden::alerts {

std::string format_subject(const AlertMessage &message) {
  std::string subject;
  if (!message.subject_prefix.empty()) {
    subject = message.subject_prefix + " ";
  }
  if (!message.host.empty()) {
    subject += message.host + ": ";
  }
  return subject + message.summary;
}

std::string format_body(const AlertMessage &message) {
  std::ostringstream out;
  out << "Host:  " << message.host << "\n";
  out << "Time:  " << message.timestamp << "\n";
  out << "Alert: " << message.alert_key << "\n\n";
  out << message.summary << "\n";
  if (!message.detail.empty()) {
    out << "\n" << message.detail << "\n";
  }
  return out.str();
}

std::string format_json(const AlertMessage &message) {
  std::ostringstream out;
  out << "{\"alert_key\":" << common::json_quote(message.alert_key)
      << ",\"host\":" << common::json_quote(message.host)
      << ",\"timestamp\":" << common::json_quote(message.timestamp)
      << ",\"subject\":" << common::json_quote(format_subject(message))
      << ",\"summary\":" << common::json_quote(message.summary)
      << ",\"detail\":" << common::json_quote(message.detail) << "}";
  return out.str();
}

common::Result<std::unique_ptr<INotifier>> make_notifier(const config::Config &config) {
  using R = common::Result<std::unique_ptr<INotifier>>;
  const auto &alerts = config.alerts;
  const std::chrono::seconds timeout(alerts.timeout_secs);
  if (!alerts.enabled || alerts.backend == "none") {
    return R::success(nullptr);
  }
  if (alerts.backend == "smtp") {
    return R::success(make_smtp_notifier(alerts.smtp, timeout));
  }
  if (alerts.backend == "webhook") {
    return R::success(make_webhook_notifier(alerts.webhook, timeout));
  }
  if (alerts.backend == "mail") {
    return R::success(make_mail_command_notifier(timeout));
  }
  if (alerts.backend == "log") {
    return R::success(make_log_notifier());
  }
  return R::failure("unknown alerts.backend: " + alerts.backend,
                    common::ErrorKind::Configuration);
}

} // namespace hostwarden::alerts
