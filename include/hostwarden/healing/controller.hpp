#pragma once

#include "hostwarden/alerts/dispatcher.hpp"
#include "hostwarden/config/schema.hpp"
#include "hostwarden/diagnostics/health.hpp"
#include "hostwarden/healing/action.hpp"
#include "hostwarden/healing/command_runner.hpp"
#include "hostwarden/healing/exclusions.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace hostwarden::journal {
class IncidentJournal;
}

namespace hostwarden::healing {

struct HealAttempted {
  HealingAction action;
  bool success = false;
  std::string detail;
};

struct NotAttempted {
  std::string reason;
  // True when a safety gate turned down a concrete target; reported as SELF_HEAL_FAIL.
  bool refused = false;
};

struct HealDecision {
  diagnostics::Subsystem subsystem = diagnostics::Subsystem::Cpu;
  std::variant<HealAttempted, NotAttempted> result;

  [[nodiscard]] bool attempted() const { return std::holds_alternative<HealAttempted>(result); }
};

using Sleeper = std::function<void(std::chrono::seconds)>;

struct ControllerDeps {
  ICommandRunner *runner = nullptr;
  alerts::AlertDispatcher *dispatcher = nullptr;
  journal::IncidentJournal *journal = nullptr;
  Sleeper sleeper;
};

/// Decides and runs remediations for one diagnostic result. Every decision passes the
/// gates in order: global switch, per-action flag, eligible WARNING/CRITICAL status,
/// target exclusions, path and age limits. At most one action runs per subsystem.
class SelfHealingController {
public:
  SelfHealingController(config::SelfHealConfig config, std::string monitored_service,
                        const std::string &monitored_process, ControllerDeps deps, int own_pid);

  std::vector<HealDecision> maybe_heal(const diagnostics::DiagnosticResult &result);

  [[nodiscard]] const ExclusionSet &exclusions() const { return exclusions_; }

private:
  HealDecision decide(const diagnostics::SubsystemResult &subsystem);
  HealDecision heal_cpu(const diagnostics::SubsystemResult &subsystem);
  HealDecision heal_disk(const diagnostics::SubsystemResult &subsystem);
  HealDecision heal_service(const diagnostics::SubsystemResult &subsystem,
                            const std::string &service);

  HealDecision execute(diagnostics::Subsystem subsystem, const HealingAction &action);
  HealDecision refuse(diagnostics::Subsystem subsystem, const std::string &action,
                      const std::string &reason);
  void journal_heal(const std::string &alert_key, const std::string &outcome,
                    const std::string &summary, const std::string &detail);

  config::SelfHealConfig config_;
  std::string monitored_service_;
  ControllerDeps deps_;
  ExclusionSet exclusions_;
  std::size_t disk_cursor_ = 0;
  std::size_t network_cursor_ = 0;
};

} // namespace hostwarden::healing
