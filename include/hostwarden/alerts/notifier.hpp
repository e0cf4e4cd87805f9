#pragma once

#include "hostwarden/common/result.hpp"
#include "hostwarden/config/schema.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace hostwarden::alerts {

struct AlertMessage {
  std::string alert_key;
  std::string subject_prefix;
  std::string summary;
  std::string detail;
  std::string recipient;
  std::string host;
  std::string timestamp;
};

[[nodiscard]] std::string format_subject(const AlertMessage &message);
[[nodiscard]] std::string format_body(const AlertMessage &message);
[[nodiscard]] std::string format_json(const AlertMessage &message);

/// Transport for a single alert. A failure Status is a transport error; the caller decides
/// what that means for cooldowns.
class INotifier {
public:
  virtual ~INotifier() = default;

  [[nodiscard]] virtual common::Status send(const AlertMessage &message) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::unique_ptr<INotifier> make_smtp_notifier(const config::SmtpConfig &smtp,
                                                            std::chrono::seconds timeout);
[[nodiscard]] std::unique_ptr<INotifier>
make_webhook_notifier(const config::WebhookConfig &webhook, std::chrono::seconds timeout);
[[nodiscard]] std::unique_ptr<INotifier> make_mail_command_notifier(std::chrono::seconds timeout);
[[nodiscard]] std::unique_ptr<INotifier> make_log_notifier();

[[nodiscard]] common::Result<std::unique_ptr<INotifier>>
make_notifier(const config::Config &config);

[[nodiscard]] std::string hmac_sha256_hex(const std::string &key, const std::string &payload);

} // namespace hostwarden::alerts
