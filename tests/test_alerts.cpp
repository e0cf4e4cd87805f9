#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "hostwarden/alerts/cooldown.hpp"
#include "hostwarden/alerts/dispatcher.hpp"
#include "hostwarden/alerts/notifier.hpp"
#include "hostwarden/journal/incident_journal.hpp"

#include <thread>

namespace {

namespace alerts = hostwarden::alerts;
namespace ht = hostwarden::testing;

alerts::DispatchSettings settings_with_cooldown(std::chrono::seconds cooldown) {
  return alerts::DispatchSettings{.enabled = true,
                                  .subject_prefix = "[hostwarden]",
                                  .recipient = "ops@example.com",
                                  .host = "web-01",
                                  .cooldown = cooldown};
}

} // namespace

void register_alerts_tests(std::vector<hostwarden::tests::TestCase> &tests) {
  using hostwarden::tests::require;
  namespace journal = hostwarden::journal;
  namespace common = hostwarden::common;

  tests.push_back({"cooldown_registry_boundary_is_inclusive", [] {
                     alerts::CooldownRegistry registry(std::chrono::seconds(3600));
                     const auto t0 = std::chrono::steady_clock::now();
                     require(registry.ready("CPU_HIGH", t0), "unseen key should be ready");
                     registry.mark_notified("CPU_HIGH", t0);
                     require(!registry.ready("CPU_HIGH", t0 + std::chrono::seconds(3599)),
                             "ready before cooldown elapsed");
                     require(registry.remaining("CPU_HIGH", t0 + std::chrono::seconds(3599)) ==
                                 std::chrono::seconds(1),
                             "remaining mismatch");
                     require(registry.ready("CPU_HIGH", t0 + std::chrono::seconds(3600)),
                             "exactly one cooldown later should be ready");
                     require(registry.ready("MEM_HIGH", t0), "keys must be independent");
                     require(registry.size() == 1, "size mismatch");
                   }});

  tests.push_back({"dispatcher_suppresses_repeat_within_cooldown", [] {
                     ht::RecordingNotifier notifier;
                     ht::ManualClock clock;
                     alerts::AlertDispatcher dispatcher(settings_with_cooldown(std::chrono::seconds(3600)),
                                                        &notifier, nullptr, clock.fn());

                     const auto first = dispatcher.notify("CPU_HIGH", "CPU usage 97.0%", "detail");
                     require(first.sent(), "first alert should be sent");
                     clock.advance(std::chrono::seconds(600));
                     const auto second = dispatcher.notify("CPU_HIGH", "CPU usage 98.0%", "detail");
                     require(!second.sent() && second.reason == "cooldown",
                             "repeat should be suppressed");
                     const auto other = dispatcher.notify("MEM_HIGH", "memory 95.0%", "");
                     require(other.sent(), "different key should not be suppressed");
                     clock.advance(std::chrono::seconds(3000));
                     const auto third = dispatcher.notify("CPU_HIGH", "CPU usage 99.0%", "detail");
                     require(third.sent(), "alert after the cooldown should be sent");
                     require(notifier.count("CPU_HIGH") == 2, "CPU_HIGH send count mismatch");
                   }});

  tests.push_back({"dispatcher_transport_failure_does_not_start_cooldown", [] {
                     ht::RecordingNotifier notifier;
                     ht::ManualClock clock;
                     alerts::AlertDispatcher dispatcher(settings_with_cooldown(std::chrono::seconds(3600)),
                                                        &notifier, nullptr, clock.fn());
                     notifier.fail_with("connection refused");
                     const auto failed = dispatcher.notify("NET_DOWN", "network down", "");
                     require(!failed.sent(), "failed send reported as sent");
                     require(failed.reason.find("connection refused") != std::string::npos,
                             "transport error not reported");
                     require(!dispatcher.cooldowns().last_notified("NET_DOWN").has_value(),
                             "failed send marked the cooldown");

                     notifier.succeed();
                     clock.advance(std::chrono::seconds(60));
                     const auto retried = dispatcher.notify("NET_DOWN", "network down", "");
                     require(retried.sent(), "next cycle should retry immediately");
                     require(notifier.attempts() == 2, "attempt count mismatch");
                   }});

  tests.push_back({"dispatcher_disabled_never_sends", [] {
                     ht::RecordingNotifier notifier;
                     auto settings = settings_with_cooldown(std::chrono::seconds(60));
                     settings.enabled = false;
                     alerts::AlertDispatcher disabled(settings, &notifier);
                     const auto result = disabled.notify("CPU_HIGH", "s", "d");
                     require(!result.sent() && result.reason == "disabled", "disabled sent");
                     require(notifier.attempts() == 0, "notifier called while disabled");

                     alerts::AlertDispatcher no_notifier(settings_with_cooldown(std::chrono::seconds(60)),
                                                         nullptr);
                     require(!no_notifier.active(), "null notifier should be inactive");
                     require(!no_notifier.notify("CPU_HIGH", "s", "d").sent(), "null notifier sent");
                   }});

  tests.push_back({"dispatcher_fills_message_fields", [] {
                     ht::RecordingNotifier notifier;
                     alerts::AlertDispatcher dispatcher(settings_with_cooldown(std::chrono::seconds(60)),
                                                        &notifier);
                     require(dispatcher.notify("DISK_HIGH_/", "disk usage on / 91.0%", "more").sent(),
                             "send failed");
                     const auto sent = notifier.sent();
                     require(sent.size() == 1, "message count mismatch");
                     const auto &message = sent.front();
                     require(message.recipient == "ops@example.com", "recipient mismatch");
                     require(message.host == "web-01", "host mismatch");
                     require(!message.timestamp.empty(), "timestamp missing");
                     require(alerts::format_subject(message) ==
                                 "[hostwarden] web-01: disk usage on / 91.0%",
                             "subject mismatch: " + alerts::format_subject(message));
                     const auto body = alerts::format_body(message);
                     require(body.find("Alert: DISK_HIGH_/") != std::string::npos, "key not in body");
                     require(body.find("more") != std::string::npos, "detail not in body");
                   }});

  tests.push_back({"dispatcher_concurrent_notifies_send_once", [] {
                     ht::RecordingNotifier notifier;
                     alerts::AlertDispatcher dispatcher(settings_with_cooldown(std::chrono::seconds(3600)),
                                                        &notifier);
                     std::vector<std::thread> threads;
                     for (int i = 0; i < 8; ++i) {
                       threads.emplace_back(
                           [&dispatcher] { (void)dispatcher.notify("SWAP_HIGH", "swap", ""); });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(notifier.count("SWAP_HIGH") == 1, "key sent more than once");
                   }});

  tests.push_back({"dispatcher_journals_every_outcome", [] {
                     ht::TempWorkspace workspace;
                     journal::IncidentJournal incidents(workspace.path() / "incidents.db");
                     require(incidents.is_open(), incidents.open_error());
                     ht::RecordingNotifier notifier;
                     ht::ManualClock clock;
                     alerts::AlertDispatcher dispatcher(settings_with_cooldown(std::chrono::seconds(3600)),
                                                        &notifier, &incidents, clock.fn());
                     (void)dispatcher.notify("CPU_HIGH", "cpu", "");
                     (void)dispatcher.notify("CPU_HIGH", "cpu", "");
                     const auto records = incidents.recent(10);
                     require(records.ok(), records.error());
                     require(records.value().size() == 2, "journal row count mismatch");
                     require(records.value()[0].outcome == "cooldown", "newest should be cooldown");
                     require(records.value()[1].outcome == "sent", "oldest should be sent");
                     require(records.value()[0].kind == journal::IncidentKind::Alert, "kind mismatch");
                   }});

  tests.push_back({"notifier_hmac_matches_rfc4231", [] {
                     require(alerts::hmac_sha256_hex("Jefe", "what do ya want for nothing?") ==
                                 "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                             "hmac mismatch");
                   }});

  tests.push_back({"notifier_json_payload_escapes_fields", [] {
                     const alerts::AlertMessage message{.alert_key = "SELF_HEAL_FAIL",
                                                        .subject_prefix = "[hw]",
                                                        .summary = "kill \"miner\" failed",
                                                        .detail = "line1\nline2",
                                                        .recipient = "",
                                                        .host = "h",
                                                        .timestamp = "2026-01-01T00:00:00Z"};
                     const auto json = alerts::format_json(message);
                     require(json.find("\"alert_key\":\"SELF_HEAL_FAIL\"") != std::string::npos,
                             "alert key missing");
                     require(json.find("kill \\\"miner\\\" failed") != std::string::npos,
                             "quotes not escaped");
                     require(json.find("line1\\nline2") != std::string::npos, "newline not escaped");
                   }});

  tests.push_back({"notifier_factory_follows_backend", [] {
                     hostwarden::config::Config config;
                     config.alerts.recipient = "ops@example.com";
                     config.alerts.backend = "none";
                     auto none = alerts::make_notifier(config);
                     require(none.ok() && none.value() == nullptr, "none should build no notifier");

                     config.alerts.backend = "log";
                     auto log = alerts::make_notifier(config);
                     require(log.ok() && log.value() != nullptr, "log notifier missing");
                     require(log.value()->send(alerts::AlertMessage{.alert_key = "X"}).ok(),
                             "log notifier should always succeed");

                     config.alerts.backend = "carrier-pigeon";
                     auto unknown = alerts::make_notifier(config);
                     require(!unknown.ok(), "unknown backend accepted");
                     require(unknown.kind() == common::ErrorKind::Configuration, "wrong error kind");

                     config.alerts.backend = "smtp";
                     config.alerts.enabled = false;
                     auto disabled = alerts::make_notifier(config);
                     require(disabled.ok() && disabled.value() == nullptr,
                             "disabled alerts built a notifier");
                   }});

  tests.push_back({"notifier_webhook_unreachable_is_transport_error", [] {
                     auto notifier = alerts::make_webhook_notifier(
                         hostwarden::config::WebhookConfig{.url = "http://127.0.0.1:1/hook",
                                                           .secret = "k"},
                         std::chrono::seconds(2));
                     const auto status =
                         notifier->send(alerts::AlertMessage{.alert_key = "NET_DOWN", .summary = "x"});
                     require(!status.ok(), "send to closed port succeeded");
                     require(status.kind() == common::ErrorKind::Transport, "wrong error kind");
                   }});
}
