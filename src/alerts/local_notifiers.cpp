#include "hostwarden/alerts/notifier.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/process.hpp"
#include "hostwarden/observability/global.hpp"

namespace hostwarden::alerts {

namespace {

class MailCommandNotifier final : public INotifier {
public:
  explicit MailCommandNotifier(const std::chrono::seconds timeout) : timeout_(timeout) {}

  [[nodiscard]] std::string_view name() const override { return "mail"; }

  [[nodiscard]] common::Status send(const AlertMessage &message) override {
    if (common::trim(message.recipient).empty()) {
      return common::Status::error("mail alert has no recipient", common::ErrorKind::Transport);
    }
    common::ProcessOptions options;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
    options.stdin_data = format_body(message);
    const auto result =
        common::run_process({"mail", "-s", format_subject(message), message.recipient}, options);
    if (!result.ok()) {
      return common::Status::error(result.error(), common::ErrorKind::Transport);
    }
    if (result.value().timed_out) {
      return common::Status::error("mail timed out", common::ErrorKind::Transport);
    }
    if (result.value().exit_code != 0) {
      const std::string reason = common::trim(result.value().stderr_text);
      return common::Status::error("mail exited with " + std::to_string(result.value().exit_code) +
                                       (reason.empty() ? "" : ": " + reason),
                                   common::ErrorKind::Transport);
    }
    return common::Status::success();
  }

private:
  std::chrono::seconds timeout_;
};

class LogNotifier final : public INotifier {
public:
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] common::Status send(const AlertMessage &message) override {
    observability::log_warn("alert", format_subject(message) +
                                         (message.detail.empty() ? "" : " | " + message.detail));
    return common::Status::success();
  }
};

} // namespace

std::unique_ptr<INotifier> make_mail_command_notifier(const std::chrono::seconds timeout) {
  return std::make_unique<MailCommandNotifier>(timeout);
}

std::unique_ptr<INotifier> make_log_notifier() { return std::make_unique<LogNotifier>(); }

} // namespace hostwarden::alerts
