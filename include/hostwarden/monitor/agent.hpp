#pragma once

#include "hostwarden/alerts/dispatcher.hpp"
#include "hostwarden/common/cancellation.hpp"
#include "hostwarden/common/result.hpp"
#include "hostwarden/config/schema.hpp"
#include "hostwarden/diagnostics/engine.hpp"
#include "hostwarden/healing/controller.hpp"
#include "hostwarden/metrics/source.hpp"
#include "hostwarden/monitor/maintenance.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostwarden::monitor {

enum class AgentState {
  Init,
  Running,
  ShuttingDown,
  Terminated,
};

[[nodiscard]] std::string_view agent_state_name(AgentState state);

struct AlertAttempt {
  std::string alert_key;
  alerts::DispatchResult result;
};

struct CycleReport {
  std::uint64_t cycle = 0;
  std::string started_at;
  diagnostics::DiagnosticResult diagnosis;
  std::vector<AlertAttempt> alerts;
  std::vector<healing::HealDecision> heals;
  MaintenanceOutcome maintenance = MaintenanceOutcome::Disabled;
  std::chrono::milliseconds duration{0};
};

struct RequiredTool {
  std::string name;
  std::string needed_for;
};

[[nodiscard]] std::vector<RequiredTool> required_tools(const config::Config &config);

using ToolLocator = std::function<std::optional<std::filesystem::path>(const std::string &)>;

struct AgentDeps {
  metrics::IMetricSource *source = nullptr;
  alerts::AlertDispatcher *dispatcher = nullptr;
  healing::SelfHealingController *healer = nullptr;
  MaintenanceScheduler *maintenance = nullptr;
  std::function<void(const CycleReport &, AgentState)> on_cycle;
  ToolLocator locate_tool;
};

class MonitorAgent {
public:
  MonitorAgent(const config::Config &config, AgentDeps deps);

  [[nodiscard]] common::Status initialize();

  CycleReport run_cycle();

  /// RUNNING until `token` is cancelled, then SHUTTING_DOWN and TERMINATED.
  [[nodiscard]] common::Status run(common::CancellationToken &token);

  [[nodiscard]] AgentState state() const { return state_.load(); }
  [[nodiscard]] std::uint64_t cycles() const { return cycle_; }

private:
  void dispatch_findings(const diagnostics::DiagnosticResult &diagnosis, CycleReport &report);

  config::Config config_;
  AgentDeps deps_;
  diagnostics::DiagnosticPolicy policy_;
  std::atomic<AgentState> state_{AgentState::Init};
  bool initialized_ = false;
  std::uint64_t cycle_ = 0;
  std::optional<CycleReport> last_report_;
};

} // namespace hostwarden::monitor
