#include "hostwarden/monitor/agent.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/config/config.hpp"
#include "hostwarden/monitor/collector.hpp"
#include "hostwarden/observability/global.hpp"

#include <algorithm>
#include <optional>

namespace hostwarden::monitor {

namespace {

void add_tool(std::vector<RequiredTool> &tools, const std::string &name,
              const std::string &needed_for) {
  const auto existing = std::find_if(tools.begin(), tools.end(),
                                     [&](const RequiredTool &tool) { return tool.name == name; });
  if (existing == tools.end()) {
    tools.push_back(RequiredTool{.name = name, .needed_for = needed_for});
  }
}

} // namespace

std::string_view agent_state_name(const AgentState state) {
  switch (state) {
  case AgentState::Init:
    return "init";
  case AgentState::Running:
    return "running";
  case AgentState::ShuttingDown:
    return "shutting_down";
  case AgentState::Terminated:
    return "terminated";
  }
  return "unknown";
}

std::vector<RequiredTool> required_tools(const config::Config &config) {
  std::vector<RequiredTool> tools;
  if (config.network.enabled) {
    add_tool(tools, "ping", "network check");
  }
  if (config.service.enabled) {
    add_tool(tools, "systemctl", "service check");
  }
  if (config.alerts.enabled && config.alerts.backend == "mail") {
    add_tool(tools, "mail", "mail alerts");
  }

  const auto &heal = config.self_heal;
  const bool privileged = (heal.enabled && (heal.cpu.enabled || heal.memory.enabled ||
                                            heal.disk.enabled || heal.service.enabled ||
                                            heal.network.enabled)) ||
                          config.maintenance.mandb_enabled;
  if (privileged && !heal.command_prefix.empty()) {
    add_tool(tools, heal.command_prefix.front(), "self_heal.command_prefix");
  }
  if (heal.enabled) {
    if (heal.cpu.enabled) {
      add_tool(tools, "kill", "self_heal.cpu");
    }
    if (heal.memory.enabled) {
      add_tool(tools, "sync", "self_heal.memory");
      add_tool(tools, "sysctl", "self_heal.memory");
    }
    if (heal.disk.enabled) {
      add_tool(tools, "find", "self_heal.disk");
    }
    if (heal.service.enabled || heal.network.enabled) {
      add_tool(tools, "systemctl", "service restarts");
    }
  }
  if (config.maintenance.mandb_enabled) {
    add_tool(tools, "mandb", "maintenance");
  }
  return tools;
}

MonitorAgent::MonitorAgent(const config::Config &config, AgentDeps deps)
    : config_(config), deps_(std::move(deps)),
      policy_(diagnostics::DiagnosticPolicy::from_config(config)) {
  if (!deps_.locate_tool) {
    deps_.locate_tool = [](const std::string &name) { return common::find_executable(name); };
  }
}

common::Status MonitorAgent::initialize() {
  if (deps_.source == nullptr) {
    return common::Status::error("no metric source", common::ErrorKind::Configuration);
  }
  auto warnings = config::validate_config(config_);
  if (!warnings.ok()) {
    return common::Status::error("invalid configuration: " + warnings.error(),
                                 common::ErrorKind::Configuration);
  }
  for (const auto &warning : warnings.value()) {
    observability::log_warn("config", warning);
  }

  std::vector<std::string> missing;
  for (const auto &tool : required_tools(config_)) {
    if (!deps_.locate_tool(tool.name).has_value()) {
      observability::log_error("agent", "required tool '" + tool.name + "' (" + tool.needed_for +
                                            ") not found on PATH");
      missing.push_back(tool.name);
    }
  }
  if (!missing.empty()) {
    return common::Status::error("missing required tools: " + common::join(missing, ", "),
                                 common::ErrorKind::Configuration);
  }

  policy_ = diagnostics::DiagnosticPolicy::from_config(config_);
  initialized_ = true;
  observability::log_info("agent", "initialized with " + std::string(deps_.source->name()) +
                                       " source, interval " +
                                       std::to_string(config_.monitor_interval_secs) + "s");
  return common::Status::success();
}

CycleReport MonitorAgent::run_cycle() {
  const auto started = std::chrono::steady_clock::now();
  CycleReport report;
  report.cycle = ++cycle_;
  report.started_at = common::now_rfc3339();

  std::optional<common::Result<metrics::CpuReading>> cpu;
  {
    const auto snapshot = collect_snapshot(*deps_.source, config_);
    report.diagnosis = diagnostics::diagnose(snapshot, policy_);
    cpu = snapshot.cpu;
  }

  for (const auto &subsystem : report.diagnosis.subsystems) {
    const std::string line = std::string(diagnostics::subsystem_name(subsystem.subsystem)) + " " +
                             std::string(diagnostics::status_name(subsystem.status)) + ": " +
                             subsystem.detail;
    if (subsystem.status == diagnostics::HealthStatus::Nominal) {
      observability::log_debug("diagnose", line);
    } else if (subsystem.status == diagnostics::HealthStatus::Error) {
      observability::log_error("diagnose", line);
    } else {
      observability::log_warn("diagnose", line);
    }
  }

  dispatch_findings(report.diagnosis, report);
  if (deps_.healer != nullptr) {
    report.heals = deps_.healer->maybe_heal(report.diagnosis);
  }
  if (deps_.maintenance != nullptr) {
    report.maintenance = deps_.maintenance->evaluate(cpu);
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  const std::string overall(diagnostics::status_name(report.diagnosis.overall));
  observability::record_cycle(report.cycle, overall, report.diagnosis.finding_count(),
                              report.duration);
  if (deps_.on_cycle) {
    deps_.on_cycle(report, state_.load());
  }
  last_report_ = report;
  return report;
}

void MonitorAgent::dispatch_findings(const diagnostics::DiagnosticResult &diagnosis,
                                     CycleReport &report) {
  if (deps_.dispatcher == nullptr) {
    return;
  }
  for (const auto &subsystem : diagnosis.subsystems) {
    for (const auto &finding : subsystem.findings) {
      if (finding.status == diagnostics::HealthStatus::Error &&
          !config_.alerts.notify_collection_errors) {
        continue;
      }
      auto result = deps_.dispatcher->notify(finding.alert_key, finding.summary, finding.detail);
      report.alerts.push_back(AlertAttempt{.alert_key = finding.alert_key, .result = std::move(result)});
    }
  }
}

common::Status MonitorAgent::run(common::CancellationToken &token) {
  if (!initialized_) {
    const auto status = initialize();
    if (!status.ok()) {
      state_ = AgentState::Terminated;
      return status;
    }
  }

  state_ = AgentState::Running;
  observability::log_info("agent", "running");
  const std::chrono::seconds interval(config_.monitor_interval_secs);

  while (!token.cancelled()) {
    const auto started = std::chrono::steady_clock::now();
    (void)run_cycle();
    if (token.cancelled()) {
      break;
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed < interval) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(interval - elapsed);
      if (!token.wait_for(remaining)) {
        break;
      }
    }
  }

  state_ = AgentState::ShuttingDown;
  observability::log_info("agent", "shutting down after " + std::to_string(cycle_) + " cycles");
  state_ = AgentState::Terminated;
  if (deps_.on_cycle && last_report_.has_value()) {
    deps_.on_cycle(*last_report_, AgentState::Terminated);
  }
  observability::flush();
  return common::Status::success();
}

} // namespace hostwarden::monitor
