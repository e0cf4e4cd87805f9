#include "hostwarden/cli/commands.hpp"

#include "hostwarden/common/cancellation.hpp"
#include "hostwarden/common/fs.hpp"
#include "hostwarden/config/config.hpp"
#include "hostwarden/daemon/pid_file.hpp"
#include "hostwarden/daemon/signal_watcher.hpp"
#include "hostwarden/diagnostics/engine.hpp"
#include "hostwarden/doctor/diagnostics.hpp"
#include "hostwarden/journal/incident_journal.hpp"
#include "hostwarden/metrics/proc_source.hpp"
#include "hostwarden/monitor/collector.hpp"
#include "hostwarden/observability/global.hpp"
#include "hostwarden/runtime/app.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace hostwarden::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config" || args[i] == "-c") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

void print_diagnosis(const diagnostics::DiagnosticResult &diagnosis) {
  for (const auto &subsystem : diagnosis.subsystems) {
    std::cout << "  " << std::left << std::setw(12) << diagnostics::subsystem_name(subsystem.subsystem)
              << std::setw(9) << diagnostics::status_name(subsystem.status) << subsystem.detail
              << "\n";
    for (const auto &finding : subsystem.findings) {
      std::cout << "    ! " << finding.alert_key << ": " << finding.summary << "\n";
    }
  }
  std::cout << "Overall: " << diagnostics::status_name(diagnosis.overall) << "\n";
}

void print_cycle(const monitor::CycleReport &report) {
  std::cout << "Cycle " << report.cycle << " at " << report.started_at << " ("
            << report.duration.count() << "ms)\n";
  print_diagnosis(report.diagnosis);
  for (const auto &alert : report.alerts) {
    std::cout << "Alert " << alert.alert_key << ": "
              << (alert.result.sent() ? "sent" : "suppressed (" + alert.result.reason + ")")
              << "\n";
  }
  for (const auto &decision : report.heals) {
    const std::string subsystem(diagnostics::subsystem_name(decision.subsystem));
    if (const auto *attempt = std::get_if<healing::HealAttempted>(&decision.result)) {
      std::cout << "Heal " << subsystem << ": " << healing::action_name(attempt->action) << " "
                << (attempt->success ? "succeeded" : "failed") << " (" << attempt->detail << ")\n";
    } else {
      std::cout << "Heal " << subsystem << ": not attempted ("
                << std::get<healing::NotAttempted>(decision.result).reason << ")\n";
    }
  }
}

int run_monitor(std::vector<std::string> args) {
  const bool once = take_flag(args, "--once");
  if (!args.empty()) {
    std::cerr << "unknown option for run: " << args.front() << "\n";
    return 1;
  }

  // Before any thread exists, so every thread inherits the blocked mask.
  const auto blocked = daemon::SignalWatcher::block_termination_signals();
  if (!blocked.ok()) {
    std::cerr << blocked.error() << "\n";
    return 1;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << "configuration error: " << context.error() << "\n";
    return 1;
  }
  context.value().install_observer();
  const auto &cfg = context.value().config();

  daemon::PidFile pid_file(config::pid_file_path(cfg));
  if (!once) {
    const auto acquired = pid_file.acquire();
    if (!acquired.ok()) {
      observability::log_error("agent", acquired.error());
      return 1;
    }
  }

  common::CancellationToken token;
  daemon::SignalWatcher watcher(token);
  watcher.start();

  auto monitor = context.value().create_monitor(&token);
  if (!monitor.ok()) {
    observability::log_error("agent", monitor.error());
    return 1;
  }
  auto &agent = *monitor.value()->agent;
  const auto initialized = agent.initialize();
  if (!initialized.ok()) {
    observability::log_error("agent", initialized.error());
    observability::flush();
    return 1;
  }

  if (once) {
    const auto report = agent.run_cycle();
    print_cycle(report);
    watcher.stop();
    observability::flush();
    return 0;
  }

  const auto status = agent.run(token);
  watcher.stop();
  pid_file.release();
  if (!status.ok()) {
    observability::log_error("agent", status.error());
    return 1;
  }
  return 0;
}

int run_check() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << "configuration error: " << context.error() << "\n";
    return 1;
  }
  context.value().install_observer();
  const auto &cfg = context.value().config();

  metrics::ProcMetricSource source;
  const auto snapshot = monitor::collect_snapshot(source, cfg);
  const auto diagnosis =
      diagnostics::diagnose(snapshot, diagnostics::DiagnosticPolicy::from_config(cfg));
  print_diagnosis(diagnosis);
  return diagnosis.overall == diagnostics::HealthStatus::Nominal ? 0 : 2;
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto pid = daemon::PidFile::running_pid(config::pid_file_path(cfg.value()));
  std::cout << "Agent: " << (pid.has_value() ? "running (pid " + std::to_string(*pid) + ")"
                                             : std::string("not running"))
            << "\n";

  const auto path = config::status_file_path(cfg.value());
  const auto content = common::read_file(path);
  if (!content.ok()) {
    std::cout << "No status file at " << path.string() << "\n";
    return pid.has_value() ? 0 : 1;
  }
  std::cout << content.value();
  return 0;
}

int run_history(std::vector<std::string> args) {
  std::size_t limit = 20;
  std::string value;
  if (take_option(args, "--limit", "-n", value)) {
    const auto *first = value.data();
    const auto *last = first + value.size();
    auto [ptr, ec] = std::from_chars(first, last, limit);
    if (ec != std::errc() || ptr != last || limit == 0) {
      std::cerr << "invalid --limit: " << value << "\n";
      return 1;
    }
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  journal::IncidentJournal journal(config::journal_path(cfg.value()));
  if (!journal.is_open()) {
    std::cerr << "cannot open incident journal: " << journal.open_error() << "\n";
    return 1;
  }
  const auto records = journal.recent(limit);
  if (!records.ok()) {
    std::cerr << records.error() << "\n";
    return 1;
  }
  if (records.value().empty()) {
    std::cout << "No incidents recorded.\n";
    return 0;
  }
  for (const auto &record : records.value()) {
    std::cout << record.recorded_at << "  " << std::left << std::setw(6)
              << journal::incident_kind_name(record.kind) << std::setw(26) << record.alert_key
              << std::setw(17) << record.outcome << record.summary << "\n";
  }
  return 0;
}

int run_doctor() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }

  const auto report = doctor::run_diagnostics(cfg.value());
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << (config::config_exists() ? "" : " (missing)") << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (action == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "configuration valid\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

} // namespace

std::string version_string() {
#ifdef HOSTWARDEN_VERSION
  std::string version = HOSTWARDEN_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef HOSTWARDEN_GIT_COMMIT
  const std::string commit = HOSTWARDEN_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "hostwarden " + version;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  hostwarden" << RESET << DIM
            << "  host health monitoring with bounded self-healing" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "hostwarden [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  AGENT" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << DIM << "              Run the monitoring loop until SIGTERM/SIGINT" << RESET << "\n";
  std::cout << "  " << GREEN << "run --once" << RESET << DIM << "       Run a single full cycle (alerts and heals included)" << RESET << "\n";
  std::cout << "  " << GREEN << "check" << RESET << DIM << "            Collect and diagnose only; exit 0 when nominal" << RESET << "\n\n";

  std::cout << BOLD << "  INSPECTION" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "           Show the last cycle written by the agent" << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << " [-n N]" << DIM << "   Show recent alerts and heal actions" << RESET << "\n";
  std::cout << "  " << GREEN << "doctor" << RESET << DIM << "           Check config, tools, notifier and state" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "      Print the effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "      Print the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM << "  Validate and list warnings" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET << "\n";
  std::cout << "  " << GREEN << "help" << RESET << DIM << "             Show this help" << RESET << "\n\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_monitor(std::move(args));
  }
  if (subcommand == "check") {
    return run_check();
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace hostwarden::cli
