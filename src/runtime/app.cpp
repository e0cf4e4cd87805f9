#include "hostwarden/runtime/app.hpp"

#include "hostwarden/config/config.hpp"
#include "hostwarden/metrics/proc_source.hpp"
#include "hostwarden/observability/factory.hpp"
#include "hostwarden/observability/global.hpp"

#include <thread>

#include <unistd.h>

namespace hostwarden::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error(), loaded.kind());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.error(), validated.kind());
  }
  RuntimeContext context(std::move(loaded.value()));
  context.warnings_ = validated.value();
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() {
  observability::set_global_observer(observability::create_observer(config_));
  for (const auto &warning : warnings_) {
    observability::log_warn("config", warning);
  }
}

common::Result<std::unique_ptr<MonitorRuntime>>
RuntimeContext::create_monitor(common::CancellationToken *token) {
  using R = common::Result<std::unique_ptr<MonitorRuntime>>;
  auto runtime = std::make_unique<MonitorRuntime>();

  runtime->source = std::make_unique<metrics::ProcMetricSource>();

  auto notifier = alerts::make_notifier(config_);
  if (!notifier.ok()) {
    return R::failure(notifier.error(), notifier.kind());
  }
  runtime->notifier = std::move(notifier.value());

  auto journal = std::make_unique<journal::IncidentJournal>(config::journal_path(config_));
  if (journal->is_open()) {
    runtime->journal = std::move(journal);
  } else {
    observability::log_warn("journal", "incident journal disabled: " + journal->open_error());
  }

  runtime->dispatcher = std::make_unique<alerts::AlertDispatcher>(
      alerts::DispatchSettings::from_config(config_), runtime->notifier.get(),
      runtime->journal.get());

  runtime->runner =
      std::make_unique<healing::PrivilegedCommandRunner>(config_.self_heal.command_prefix);

  healing::ControllerDeps deps;
  deps.runner = runtime->runner.get();
  deps.dispatcher = runtime->dispatcher.get();
  deps.journal = runtime->journal.get();
  deps.sleeper = [token](const std::chrono::seconds delay) {
    if (token != nullptr) {
      (void)token->wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(delay));
    } else {
      std::this_thread::sleep_for(delay);
    }
  };
  runtime->healer = std::make_unique<healing::SelfHealingController>(
      config_.self_heal, config_.service.service_name, config_.service.process_name,
      std::move(deps), static_cast<int>(getpid()));

  runtime->maintenance = std::make_unique<monitor::MaintenanceScheduler>(
      config_.maintenance, runtime->runner.get(),
      std::chrono::seconds(config_.self_heal.action_timeout_secs));

  runtime->state_writer = std::make_unique<daemon::StateWriter>(config::status_file_path(config_));

  monitor::AgentDeps agent_deps;
  agent_deps.source = runtime->source.get();
  agent_deps.dispatcher = runtime->dispatcher.get();
  agent_deps.healer = runtime->healer.get();
  agent_deps.maintenance = runtime->maintenance.get();
  auto *writer = runtime->state_writer.get();
  agent_deps.on_cycle = [writer](const monitor::CycleReport &report,
                                 const monitor::AgentState state) {
    const auto written = writer->write(report, state);
    if (!written.ok()) {
      observability::log_warn("daemon", "status file not written: " + written.error());
    }
  };
  runtime->agent = std::make_unique<monitor::MonitorAgent>(config_, std::move(agent_deps));
  return R::success(std::move(runtime));
}

} // namespace hostwarden::runtime
