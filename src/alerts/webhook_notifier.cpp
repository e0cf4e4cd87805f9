#include "hostwarden/alerts/notifier.hpp"

#include "hostwarden/common/fs.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <sstream>

namespace hostwarden::alerts {

namespace {

std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

class WebhookNotifier final : public INotifier {
public:
  WebhookNotifier(config::WebhookConfig webhook, const std::chrono::seconds timeout)
      : webhook_(std::move(webhook)), timeout_(timeout) {}

  [[nodiscard]] std::string_view name() const override { return "webhook"; }

  [[nodiscard]] common::Status send(const AlertMessage &message) override {
    if (common::trim(webhook_.url).empty()) {
      return common::Status::error("webhook url is required", common::ErrorKind::Transport);
    }

    CURL *curl = curl_easy_init();
    if (curl == nullptr) {
      return common::Status::error("curl_easy_init failed", common::ErrorKind::Transport);
    }

    const std::string body = format_json(message);
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, webhook_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(std::chrono::milliseconds(timeout_).count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "hostwarden");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    struct curl_slist *header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    if (!webhook_.secret.empty()) {
      const std::string signature =
          "X-Hostwarden-Signature: sha256=" + hmac_sha256_hex(webhook_.secret, body);
      header_list = curl_slist_append(header_list, signature.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
      return common::Status::error("webhook post failed: " + std::string(curl_easy_strerror(code)),
                                   common::ErrorKind::Transport);
    }
    if (status < 200 || status >= 300) {
      return common::Status::error("webhook returned HTTP " + std::to_string(status) +
                                       (response.empty() ? "" : ": " + response.substr(0, 200)),
                                   common::ErrorKind::Transport);
    }
    return common::Status::success();
  }

private:
  config::WebhookConfig webhook_;
  std::chrono::seconds timeout_;
};

} // namespace

std::string hmac_sha256_hex(const std::string &key, const std::string &payload) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char *>(payload.data()), payload.size(), digest, &length);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return stream.str();
}

std::unique_ptr<INotifier> make_webhook_notifier(const config::WebhookConfig &webhook,
                                                 const std::chrono::seconds timeout) {
  return std::make_unique<WebhookNotifier>(webhook, timeout);
}

} // namespace hostwarden::alerts
