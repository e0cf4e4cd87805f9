#include "hostwarden/alerts/notifier.hpp"

#include "hostwarden/common/fs.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <sstream>

namespace hostwarden::alerts {

namespace {

struct UploadPayload {
  std::string data;
  std::size_t offset = 0;
};

std::size_t upload_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata) {
  auto *payload = static_cast<UploadPayload *>(userdata);
  const std::size_t capacity = size * nitems;
  if (payload == nullptr || capacity == 0 || payload->offset >= payload->data.size()) {
    return 0;
  }

  const std::size_t remaining = payload->data.size() - payload->offset;
  const std::size_t to_copy = std::min(remaining, capacity);
  std::memcpy(buffer, payload->data.data() + payload->offset, to_copy);
  payload->offset += to_copy;
  return to_copy;
}

std::string format_smtp_payload(const AlertMessage &message, const std::string &from) {
  std::ostringstream out;
  out << "To: " << message.recipient << "\r\n";
  out << "From: " << from << "\r\n";
  out << "Subject: " << format_subject(message) << "\r\n";
  out << "MIME-Version: 1.0\r\n";
  out << "Content-Type: text/plain; charset=utf-8\r\n";
  out << "\r\n";
  const std::string body = format_body(message);
  for (const char ch : body) {
    if (ch == '\n') {
      out << "\r\n";
    } else {
      out << ch;
    }
  }
  return out.str();
}

class SmtpNotifier final : public INotifier {
public:
  SmtpNotifier(config::SmtpConfig smtp, const std::chrono::seconds timeout)
      : smtp_(std::move(smtp)), timeout_(timeout) {}

  [[nodiscard]] std::string_view name() const override { return "smtp"; }

  [[nodiscard]] common::Status send(const AlertMessage &message) override {
    if (common::trim(message.recipient).empty()) {
      return common::Status::error("smtp alert has no recipient", common::ErrorKind::Transport);
    }
    if (common::trim(smtp_.host).empty()) {
      return common::Status::error("smtp host is required", common::ErrorKind::Transport);
    }

    std::string url = smtp_.tls ? "smtps://" : "smtp://";
    url += smtp_.host + ":" + std::to_string(smtp_.port);

    CURL *curl = curl_easy_init();
    if (curl == nullptr) {
      return common::Status::error("failed to initialize curl for smtp",
                                   common::ErrorKind::Transport);
    }

    UploadPayload payload;
    payload.data = format_smtp_payload(message, smtp_.sender);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (!smtp_.username.empty()) {
      curl_easy_setopt(curl, CURLOPT_USERNAME, smtp_.username.c_str());
      curl_easy_setopt(curl, CURLOPT_PASSWORD, smtp_.password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_USE_SSL, smtp_.tls ? CURLUSESSL_ALL : CURLUSESSL_NONE);
    const std::string mail_from = "<" + smtp_.sender + ">";
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, upload_callback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::chrono::milliseconds(timeout_).count()));

    struct curl_slist *recipients = nullptr;
    recipients = curl_slist_append(recipients, ("<" + message.recipient + ">").c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);

    const auto code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
      return common::Status::error("smtp send failed: " + std::string(curl_easy_strerror(code)),
                                   common::ErrorKind::Transport);
    }
    if (status >= 400) {
      return common::Status::error("smtp server rejected message with status " +
                                       std::to_string(status),
                                   common::ErrorKind::Transport);
    }
    return common::Status::success();
  }

private:
  config::SmtpConfig smtp_;
  std::chrono::seconds timeout_;
};

} // namespace

std::unique_ptr<INotifier> make_smtp_notifier(const config::SmtpConfig &smtp,
                                              const std::chrono::seconds timeout) {
  return std::make_unique<SmtpNotifier>(smtp, timeout);
}

} // namespace hostwarden::alerts
