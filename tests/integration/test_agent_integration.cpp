#include "test_framework.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/config/config.hpp"
#include "hostwarden/journal/incident_journal.hpp"
#include "hostwarden/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <thread>

namespace {

namespace ht = hostwarden::testing;
namespace common = hostwarden::common;

struct ConfigPathOverride {
  explicit ConfigPathOverride(const std::filesystem::path &path) {
    hostwarden::config::set_config_path_override(path);
  }
  ~ConfigPathOverride() { hostwarden::config::clear_config_path_override(); }
};

std::string quiet_toml(const ht::TempWorkspace &workspace) {
  return "monitor_interval_secs = 10\n"
         "\n"
         "[logging]\n"
         "backend = \"none\"\n"
         "\n"
         "[network]\n"
         "enabled = false\n"
         "\n"
         "[service]\n"
         "enabled = false\n"
         "\n"
         "[port]\n"
         "enabled = false\n"
         "\n"
         "[alerts]\n"
         "backend = \"log\"\n"
         "recipient = \"ops@example.com\"\n"
         "cooldown_secs = 600\n"
         "\n"
         "[state]\n"
         "dir = \"" +
         (workspace.path() / "state").string() + "\"\n";
}

} // namespace

void register_agent_integration_tests(std::vector<hostwarden::tests::TestCase> &tests) {
  using hostwarden::tests::require;

  tests.push_back({"integration_runtime_loads_config_from_disk", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("hostwarden.toml",
                                           quiet_toml(workspace) + "\n[extras]\nflavour = \"x\"\n");
                     ConfigPathOverride override_path(workspace.path() / "hostwarden.toml");
                     ht::EnvGuard recipient("HOSTWARDEN_ALERT_RECIPIENT", "pager@example.com");

                     auto context = hostwarden::runtime::RuntimeContext::from_disk();
                     require(context.ok(), context.error());
                     const auto &config = context.value().config();
                     require(config.alerts.backend == "log", "backend not loaded");
                     require(config.alerts.cooldown_secs == 600, "cooldown not loaded");
                     require(config.alerts.recipient == "pager@example.com",
                             "environment should override the file");
                     require(!config.network.enabled, "network flag not loaded");
                     const auto &warnings = context.value().warnings();
                     require(warnings.size() == 1 &&
                                 warnings.front().find("extras.flavour") != std::string::npos,
                             "unknown key should be warned about exactly once");
                   }});

  tests.push_back({"integration_runtime_rejects_invalid_file", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("hostwarden.toml", "monitor_interval_secs = 2\n");
                     ConfigPathOverride override_path(workspace.path() / "hostwarden.toml");
                     const auto context = hostwarden::runtime::RuntimeContext::from_disk();
                     require(!context.ok(), "interval below the minimum accepted");
                     require(context.kind() == common::ErrorKind::Configuration, "wrong error kind");
                   }});

  tests.push_back({"integration_agent_cycle_on_live_host", [] {
                     ht::TempWorkspace workspace;
                     hostwarden::runtime::RuntimeContext context(ht::quiet_config(workspace));
                     common::CancellationToken token;
                     auto runtime = context.create_monitor(&token);
                     require(runtime.ok(), runtime.error());
                     auto &agent = *runtime.value()->agent;
                     const auto init = agent.initialize();
                     require(init.ok(), init.error());

                     const auto report = agent.run_cycle();
                     require(report.cycle == 1, "cycle number mismatch");
                     require(!report.diagnosis.subsystems.empty(), "nothing diagnosed");
                     require(runtime.value()->journal != nullptr, "journal not opened");

                     const auto status_path = hostwarden::config::status_file_path(context.config());
                     const auto status = common::read_file(status_path);
                     require(status.ok(), status.error());
                     require(status.value().find("\"cycle\":1") != std::string::npos,
                             "status file not written");
                     require(std::filesystem::exists(
                                 hostwarden::config::journal_path(context.config())),
                             "journal database not created");
                   }});

  tests.push_back({"integration_agent_loop_shuts_down_cleanly", [] {
                     ht::TempWorkspace workspace;
                     hostwarden::runtime::RuntimeContext context(ht::quiet_config(workspace));
                     common::CancellationToken token;
                     auto runtime = context.create_monitor(&token);
                     require(runtime.ok(), runtime.error());

                     std::thread stopper([&token] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(300));
                       token.cancel();
                     });
                     const auto status = runtime.value()->agent->run(token);
                     stopper.join();
                     require(status.ok(), status.error());
                     require(runtime.value()->agent->cycles() >= 1, "no cycle ran");

                     const auto written =
                         common::read_file(hostwarden::config::status_file_path(context.config()));
                     require(written.ok(), written.error());
                     require(written.value().find("\"state\":\"terminated\"") != std::string::npos,
                             "final state not written");
                   }});
}
