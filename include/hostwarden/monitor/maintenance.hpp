#pragma once

#include "hostwarden/alerts/cooldown.hpp"
#include "hostwarden/config/schema.hpp"
#include "hostwarden/healing/command_runner.hpp"
#include "hostwarden/metrics/snapshot.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

namespace hostwarden::monitor {

enum class MaintenanceOutcome {
  Disabled,
  NotDue,
  CpuBusy,
  CpuUnknown,
  Ran,
  Failed,
};

[[nodiscard]] std::string_view maintenance_outcome_name(MaintenanceOutcome outcome);

/// Throttles RUN_MANDB: only on a quiet CPU and no more often than the configured interval
/// since the last successful run.
class MaintenanceScheduler {
public:
  MaintenanceScheduler(config::MaintenanceConfig config, healing::ICommandRunner *runner,
                       std::chrono::seconds action_timeout,
                       std::function<alerts::SteadyTime()> clock = {});

  MaintenanceOutcome evaluate(const std::optional<common::Result<metrics::CpuReading>> &cpu);

  [[nodiscard]] std::optional<alerts::SteadyTime> last_success() const { return last_success_; }

private:
  config::MaintenanceConfig config_;
  healing::ICommandRunner *runner_;
  std::chrono::seconds action_timeout_;
  std::function<alerts::SteadyTime()> clock_;
  std::optional<alerts::SteadyTime> last_success_;
};

} // namespace hostwarden::monitor
