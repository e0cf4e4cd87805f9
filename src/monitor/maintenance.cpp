#include "hostwarden/monitor/maintenance.hpp"

#include "hostwarden/observability/global.hpp"

namespace hostwarden::monitor {

std::string_view maintenance_outcome_name(const MaintenanceOutcome outcome) {
  switch (outcome) {
  case MaintenanceOutcome::Disabled:
    return "disabled";
  case MaintenanceOutcome::NotDue:
    return "not_due";
  case MaintenanceOutcome::CpuBusy:
    return "cpu_busy";
  case MaintenanceOutcome::CpuUnknown:
    return "cpu_unknown";
  case MaintenanceOutcome::Ran:
    return "ran";
  case MaintenanceOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

MaintenanceScheduler::MaintenanceScheduler(config::MaintenanceConfig config,
                                           healing::ICommandRunner *runner,
                                           const std::chrono::seconds action_timeout,
                                           std::function<alerts::SteadyTime()> clock)
    : config_(std::move(config)), runner_(runner), action_timeout_(action_timeout),
      clock_(clock ? std::move(clock)
                   : std::function<alerts::SteadyTime()>(
                         [] { return std::chrono::steady_clock::now(); })) {}

MaintenanceOutcome
MaintenanceScheduler::evaluate(const std::optional<common::Result<metrics::CpuReading>> &cpu) {
  if (!config_.mandb_enabled || runner_ == nullptr) {
    return MaintenanceOutcome::Disabled;
  }
  const auto now = clock_();
  if (last_success_.has_value() &&
      now - *last_success_ < std::chrono::hours(config_.min_interval_hours)) {
    return MaintenanceOutcome::NotDue;
  }
  if (!cpu.has_value() || !cpu->ok()) {
    return MaintenanceOutcome::CpuUnknown;
  }
  const double percent = cpu->value().percent;
  if (percent >= config_.cpu_permit_percent) {
    observability::log_debug("maintenance", "mandb deferred, CPU at " +
                                                std::to_string(static_cast<int>(percent)) + "%");
    return MaintenanceOutcome::CpuBusy;
  }

  const auto result = runner_->run(healing::RunMandb{}, action_timeout_);
  if (!result.ok()) {
    observability::log_error("maintenance", "mandb failed to start: " + result.error());
    observability::record_heal("RUN_MANDB", false, result.error());
    return MaintenanceOutcome::Failed;
  }
  if (!result.value().succeeded()) {
    const std::string detail = result.value().timed_out
                                   ? "timed out"
                                   : "exit " + std::to_string(result.value().exit_code);
    observability::log_error("maintenance", "mandb failed: " + detail);
    observability::record_heal("RUN_MANDB", false, detail);
    return MaintenanceOutcome::Failed;
  }
  last_success_ = now;
  observability::log_info("maintenance", "man page index rebuilt");
  observability::record_heal("RUN_MANDB", true, result.value().command);
  return MaintenanceOutcome::Ran;
}

} // namespace hostwarden::monitor
