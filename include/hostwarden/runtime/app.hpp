#pragma once

#include "hostwarden/alerts/dispatcher.hpp"
#include "hostwarden/alerts/notifier.hpp"
#include "hostwarden/common/cancellation.hpp"
#include "hostwarden/common/result.hpp"
#include "hostwarden/config/schema.hpp"
#include "hostwarden/daemon/state_writer.hpp"
#include "hostwarden/healing/command_runner.hpp"
#include "hostwarden/healing/controller.hpp"
#include "hostwarden/journal/incident_journal.hpp"
#include "hostwarden/metrics/source.hpp"
#include "hostwarden/monitor/agent.hpp"
#include "hostwarden/monitor/maintenance.hpp"

#include <memory>
#include <vector>

namespace hostwarden::runtime {

/// Owns every collaborator of one agent. Members reference each other by pointer, so the
/// bundle is neither copied nor moved.
struct MonitorRuntime {
  MonitorRuntime() = default;
  MonitorRuntime(const MonitorRuntime &) = delete;
  MonitorRuntime &operator=(const MonitorRuntime &) = delete;

  std::unique_ptr<metrics::IMetricSource> source;
  std::unique_ptr<alerts::INotifier> notifier;
  std::unique_ptr<journal::IncidentJournal> journal;
  std::unique_ptr<alerts::AlertDispatcher> dispatcher;
  std::unique_ptr<healing::ICommandRunner> runner;
  std::unique_ptr<healing::SelfHealingController> healer;
  std::unique_ptr<monitor::MaintenanceScheduler> maintenance;
  std::unique_ptr<daemon::StateWriter> state_writer;
  std::unique_ptr<monitor::MonitorAgent> agent;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  void install_observer();

  [[nodiscard]] common::Result<std::unique_ptr<MonitorRuntime>>
  create_monitor(common::CancellationToken *token);

private:
  config::Config config_;
  std::vector<std::string> warnings_;
};

} // namespace hostwarden::runtime
