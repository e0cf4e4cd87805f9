#include "hostwarden/healing/controller.hpp"

#include "hostwarden/diagnostics/engine.hpp"
#include "hostwarden/journal/incident_journal.hpp"
#include "hostwarden/observability/global.hpp"

#include <thread>

namespace hostwarden::healing {

using diagnostics::HealthStatus;
using diagnostics::Subsystem;

namespace {

NotAttempted skipped(std::string reason) { return NotAttempted{.reason = std::move(reason)}; }

} // namespace

SelfHealingController::SelfHealingController(config::SelfHealConfig config,
                                             std::string monitored_service,
                                             const std::string &monitored_process,
                                             ControllerDeps deps, const int own_pid)
    : config_(std::move(config)), monitored_service_(std::move(monitored_service)),
      deps_(std::move(deps)), exclusions_(config_, own_pid, monitored_process) {
  if (!deps_.sleeper) {
    deps_.sleeper = [](const std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
  }
}

std::vector<HealDecision>
SelfHealingController::maybe_heal(const diagnostics::DiagnosticResult &result) {
  std::vector<HealDecision> decisions;
  for (const auto &subsystem : result.subsystems) {
    if (subsystem.status == HealthStatus::Nominal) {
      continue;
    }
    decisions.push_back(decide(subsystem));
    const auto &decision = decisions.back();
    if (const auto *not_attempted = std::get_if<NotAttempted>(&decision.result);
        not_attempted != nullptr && !not_attempted->refused) {
      observability::log_debug("healing", std::string(diagnostics::subsystem_name(
                                              subsystem.subsystem)) +
                                              ": no action, " + not_attempted->reason);
    }
  }
  return decisions;
}

HealDecision SelfHealingController::decide(const diagnostics::SubsystemResult &subsystem) {
  const Subsystem which = subsystem.subsystem;
  if (!config_.enabled) {
    return HealDecision{.subsystem = which, .result = skipped("self-healing disabled")};
  }

  bool flag = false;
  switch (which) {
  case Subsystem::Cpu:
    flag = config_.cpu.enabled;
    break;
  case Subsystem::Memory:
    flag = config_.memory.enabled;
    break;
  case Subsystem::Disk:
    flag = config_.disk.enabled;
    break;
  case Subsystem::Service:
    flag = config_.service.enabled;
    break;
  case Subsystem::Network:
    flag = config_.network.enabled;
    break;
  case Subsystem::Port:
  case Subsystem::Processes:
  case Subsystem::Temperature:
    return HealDecision{.subsystem = which, .result = skipped("no remediation exists")};
  }
  if (!flag) {
    return HealDecision{.subsystem = which,
                        .result = skipped(std::string(diagnostics::subsystem_name(which)) +
                                          " remediation disabled")};
  }

  if (subsystem.status == HealthStatus::Error) {
    return HealDecision{.subsystem = which, .result = skipped("reading unavailable")};
  }
  if ((subsystem.status != HealthStatus::Warning && subsystem.status != HealthStatus::Critical) ||
      !subsystem.heal_eligible) {
    return HealDecision{.subsystem = which, .result = skipped("not eligible for remediation")};
  }

  switch (which) {
  case Subsystem::Cpu:
    return heal_cpu(subsystem);
  case Subsystem::Memory:
    return execute(which, DropCaches{});
  case Subsystem::Disk:
    return heal_disk(subsystem);
  case Subsystem::Service: {
    const std::string service =
        config_.service.service_name.empty() ? monitored_service_ : config_.service.service_name;
    return heal_service(subsystem, service);
  }
  case Subsystem::Network: {
    if (config_.network.service_names.empty()) {
      return HealDecision{.subsystem = which, .result = skipped("no network services configured")};
    }
    const auto &service =
        config_.network.service_names[network_cursor_ % config_.network.service_names.size()];
    ++network_cursor_;
    return heal_service(subsystem, service);
  }
  default:
    return HealDecision{.subsystem = which, .result = skipped("no remediation exists")};
  }
}

HealDecision SelfHealingController::heal_cpu(const diagnostics::SubsystemResult &subsystem) {
  if (!subsystem.has_finding(diagnostics::keys::kCpuHigh)) {
    return HealDecision{.subsystem = Subsystem::Cpu, .result = skipped("CPU usage not high")};
  }
  if (subsystem.observed_value < config_.cpu.threshold_percent) {
    return HealDecision{.subsystem = Subsystem::Cpu,
                        .result = skipped("CPU usage below the self-heal threshold")};
  }
  if (subsystem.offenders.empty()) {
    return HealDecision{.subsystem = Subsystem::Cpu,
                        .result = skipped("no process above the CPU threshold")};
  }

  std::string first_refusal;
  for (const auto &candidate : subsystem.offenders) {
    std::optional<std::string> refusal = exclusions_.refuse_process(candidate);
    if (!refusal.has_value() &&
        candidate.age_seconds < static_cast<double>(config_.cpu.min_process_age_secs)) {
      refusal = "process " + candidate.name + " started less than " +
                std::to_string(config_.cpu.min_process_age_secs) + "s ago";
    }
    if (!refusal.has_value()) {
      return execute(Subsystem::Cpu, KillProcess{.pid = candidate.pid,
                                                 .name = candidate.name,
                                                 .user = candidate.user});
    }
    observability::log_info("healing", "skipping pid " + std::to_string(candidate.pid) + ": " +
                                           *refusal);
    if (first_refusal.empty()) {
      first_refusal = *refusal;
    }
  }
  return refuse(Subsystem::Cpu, "KILL_PROCESS", first_refusal);
}

HealDecision SelfHealingController::heal_disk(const diagnostics::SubsystemResult &) {
  const DeleteStaleFiles targets[] = {
      DeleteStaleFiles{.path = config_.disk.log_path,
                       .max_age_days = config_.disk.log_max_age_days,
                       .basis = AgeBasis::Modified},
      DeleteStaleFiles{.path = config_.disk.tmp_path,
                       .max_age_days = config_.disk.tmp_max_age_days,
                       .basis = AgeBasis::Accessed},
  };
  const auto &target = targets[disk_cursor_ % 2];
  ++disk_cursor_;

  if (const auto refusal = exclusions_.refuse_path(target.path, target.max_age_days)) {
    return refuse(Subsystem::Disk, "DELETE_STALE_FILES", *refusal);
  }
  return execute(Subsystem::Disk, target);
}

HealDecision SelfHealingController::heal_service(const diagnostics::SubsystemResult &subsystem,
                                                 const std::string &service) {
  if (const auto refusal = exclusions_.refuse_service(service)) {
    return refuse(subsystem.subsystem, "RESTART_SERVICE", *refusal);
  }
  auto decision = execute(subsystem.subsystem, RestartService{.service = service});
  const auto &attempt = std::get<HealAttempted>(decision.result);
  if (attempt.success && config_.settle_delay_secs > 0) {
    observability::log_debug("healing", "waiting " + std::to_string(config_.settle_delay_secs) +
                                            "s for " + service + " to settle");
    deps_.sleeper(std::chrono::seconds(config_.settle_delay_secs));
  }
  return decision;
}

HealDecision SelfHealingController::execute(const Subsystem subsystem,
                                            const HealingAction &action) {
  const std::string name(action_name(action));
  const std::string what = describe(action);
  observability::log_info("healing", "attempting " + name + ": " + what);

  bool success = false;
  std::string detail;
  if (deps_.runner == nullptr) {
    detail = "no command runner";
  } else {
    const auto result =
        deps_.runner->run(action, std::chrono::seconds(config_.action_timeout_secs));
    if (!result.ok()) {
      detail = result.error();
    } else if (result.value().timed_out) {
      detail = result.value().command + " timed out after " +
               std::to_string(config_.action_timeout_secs) + "s";
    } else if (result.value().exit_code != 0) {
      detail = result.value().command + " exited with " +
               std::to_string(result.value().exit_code) +
               (result.value().output.empty() ? "" : ": " + result.value().output);
    } else {
      success = true;
      detail = result.value().command;
    }
  }

  const std::string key =
      success ? diagnostics::keys::kSelfHealAttempt : diagnostics::keys::kSelfHealFail;
  const std::string summary = "self-heal " + name + " " + (success ? "succeeded" : "failed") +
                              ": " + what;
  if (success) {
    observability::log_info("healing", summary);
  } else {
    observability::log_error("healing", summary + " (" + detail + ")");
  }
  observability::record_heal(name, success, detail);
  journal_heal(key, success ? "succeeded" : "failed", summary, detail);
  if (deps_.dispatcher != nullptr) {
    (void)deps_.dispatcher->notify(key, summary, detail);
  }
  return HealDecision{.subsystem = subsystem,
                      .result = HealAttempted{.action = action, .success = success,
                                              .detail = detail}};
}

HealDecision SelfHealingController::refuse(const Subsystem subsystem, const std::string &action,
                                           const std::string &reason) {
  const std::string summary = "self-heal " + action + " refused for " +
                              std::string(diagnostics::subsystem_name(subsystem));
  observability::log_warn("healing", summary + ": " + reason);
  observability::record_heal(action, false, reason);
  journal_heal(diagnostics::keys::kSelfHealFail, "refused", summary, reason);
  if (deps_.dispatcher != nullptr) {
    (void)deps_.dispatcher->notify(diagnostics::keys::kSelfHealFail, summary, reason);
  }
  return HealDecision{.subsystem = subsystem,
                      .result = NotAttempted{.reason = reason, .refused = true}};
}

void SelfHealingController::journal_heal(const std::string &alert_key, const std::string &outcome,
                                         const std::string &summary, const std::string &detail) {
  if (deps_.journal == nullptr) {
    return;
  }
  const auto status = deps_.journal->record(journal::IncidentRecord{.kind = journal::IncidentKind::Heal,
                                                                    .alert_key = alert_key,
                                                                    .outcome = outcome,
                                                                    .summary = summary,
                                                                    .detail = detail});
  if (!status.ok()) {
    observability::log_warn("journal", "could not record heal outcome: " + status.error());
  }
}

} // namespace hostwarden::healing
