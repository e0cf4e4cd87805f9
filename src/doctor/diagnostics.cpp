#include "hostwarden/doctor/diagnostics.hpp"

#include "hostwarden/alerts/notifier.hpp"
#include "hostwarden/common/fs.hpp"
#include "hostwarden/config/config.hpp"
#include "hostwarden/daemon/pid_file.hpp"
#include "hostwarden/journal/incident_journal.hpp"

#include <chrono>
#include <iostream>

#include <unistd.h>

namespace hostwarden::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  const auto &warnings = validation.value();
  if (!warnings.empty()) {
    check.status = CheckStatus::Warn;
    check.message = warnings.front();
    if (warnings.size() > 1) {
      check.message += " (+" + std::to_string(warnings.size() - 1) + " more)";
    }
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

std::vector<DiagnosticCheck> check_tools(const config::Config &config,
                                         const monitor::ToolLocator &locate) {
  std::vector<DiagnosticCheck> checks;
  for (const auto &tool : monitor::required_tools(config)) {
    DiagnosticCheck check;
    check.name = "Tool:" + tool.name;
    const auto found = locate(tool.name);
    if (found.has_value()) {
      check.status = CheckStatus::Pass;
      check.message = found->string();
    } else {
      check.status = CheckStatus::Fail;
      check.message = "not found on PATH (needed for " + tool.needed_for + ")";
    }
    checks.push_back(std::move(check));
  }
  return checks;
}

DiagnosticCheck check_notifier(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Notifier";
  auto notifier = alerts::make_notifier(config);
  if (!notifier.ok()) {
    check.status = CheckStatus::Fail;
    check.message = notifier.error();
    return check;
  }
  if (notifier.value() == nullptr) {
    check.status = CheckStatus::Warn;
    check.message = "alerting disabled";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = std::string(notifier.value()->name());
  const auto &backend = config.alerts.backend;
  if ((backend == "smtp" || backend == "mail") && !config.alerts.recipient.empty()) {
    check.message += " -> " + config.alerts.recipient;
  } else if (backend == "webhook") {
    check.message += " -> " + config.alerts.webhook.url;
  }
  return check;
}

DiagnosticCheck check_state_dir(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "State dir";
  const auto dir = config::state_dir(config);
  auto ensured = common::ensure_dir(dir);
  if (!ensured.ok()) {
    check.status = CheckStatus::Fail;
    check.message = ensured.error();
    return check;
  }
  const auto probe = dir / (".doctor-probe-" + std::to_string(getpid()));
  const auto written = common::write_file_atomic(probe, "ok\n");
  if (!written.ok()) {
    check.status = CheckStatus::Fail;
    check.message = "not writable: " + written.error();
    return check;
  }
  std::error_code ec;
  std::filesystem::remove(probe, ec);
  check.status = CheckStatus::Pass;
  check.message = dir.string();
  return check;
}

DiagnosticCheck check_journal(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Journal";
  const auto start = std::chrono::steady_clock::now();
  journal::IncidentJournal journal(config::journal_path(config));
  if (!journal.is_open()) {
    check.status = CheckStatus::Fail;
    check.message = journal.open_error();
    return check;
  }
  const auto total = journal.count();
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (!total.ok()) {
    check.status = CheckStatus::Fail;
    check.message = total.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = journal.path().string() + " incidents=" + std::to_string(total.value());
  return check;
}

DiagnosticCheck check_agent(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Agent";
  const auto pid_path = config::pid_file_path(config);
  if (!std::filesystem::exists(pid_path)) {
    check.status = CheckStatus::Warn;
    check.message = "not running";
    return check;
  }
  const auto pid = daemon::PidFile::running_pid(pid_path);
  if (pid.has_value()) {
    check.status = CheckStatus::Pass;
    check.message = "running (pid=" + std::to_string(*pid) + ")";
  } else {
    check.status = CheckStatus::Warn;
    check.message = "not running (stale pid file)";
  }
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config, const DoctorOptions &options) {
  DiagnosticsReport report;
  config::Config checked = config;
  const monitor::ToolLocator locate =
      options.locate_tool ? options.locate_tool
                          : monitor::ToolLocator([](const std::string &name) {
                              return common::find_executable(name);
                            });

  add_check(report, check_config(checked));
  for (auto &check : check_tools(checked, locate)) {
    add_check(report, std::move(check));
  }
  add_check(report, check_notifier(checked));
  add_check(report, check_state_dir(checked));
  add_check(report, check_journal(checked));
  add_check(report, check_agent(checked));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    std::cout << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      std::cout << " (" << check.latency->count() << "ms)";
    }
    std::cout << "\n";
  }

  std::cout << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
            << report.warnings << " warnings\n";
}

} // namespace hostwarden::doctor
