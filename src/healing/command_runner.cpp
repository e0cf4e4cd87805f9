#include "hostwarden/healing/command_runner.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/process.hpp"
#include "hostwarden/observability/global.hpp"

namespace hostwarden::healing {

PrivilegedCommandRunner::PrivilegedCommandRunner(std::vector<std::string> prefix)
    : prefix_(std::move(prefix)) {}

std::vector<std::string>
PrivilegedCommandRunner::full_argv(const std::vector<std::string> &argv) const {
  std::vector<std::string> out = prefix_;
  out.insert(out.end(), argv.begin(), argv.end());
  return out;
}

common::Result<CommandOutcome> PrivilegedCommandRunner::run(const HealingAction &action,
                                                            const std::chrono::seconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  CommandOutcome outcome;

  for (const auto &step : command_plan(action)) {
    const auto argv = full_argv(step);
    outcome.command = common::join_command(argv);

    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      outcome.timed_out = true;
      return common::Result<CommandOutcome>::success(std::move(outcome));
    }

    observability::log_debug("healing", "exec: " + outcome.command);
    common::ProcessOptions options;
    options.timeout = left;
    const auto result = common::run_process(argv, options);
    if (!result.ok()) {
      return common::Result<CommandOutcome>::failure(outcome.command + ": " + result.error(),
                                                     common::ErrorKind::Remediation);
    }

    outcome.exit_code = result.value().exit_code;
    outcome.timed_out = result.value().timed_out;
    outcome.output = common::trim(result.value().stderr_text.empty()
                                      ? result.value().stdout_text
                                      : result.value().stderr_text);
    if (!outcome.succeeded()) {
      break;
    }
  }
  return common::Result<CommandOutcome>::success(std::move(outcome));
}

} // namespace hostwarden::healing
