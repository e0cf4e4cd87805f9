#pragma once

#include "hostwarden/common/result.hpp"
#include "hostwarden/healing/action.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hostwarden::healing {

struct CommandOutcome {
  int exit_code = 0;
  bool timed_out = false;
  std::string command;
  std::string output;

  [[nodiscard]] bool succeeded() const { return !timed_out && exit_code == 0; }
};

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  /// Runs the action's command plan in order, stopping at the first failing step. The
  /// timeout bounds the whole plan. A failure Result means a command could not be started.
  [[nodiscard]] virtual common::Result<CommandOutcome> run(const HealingAction &action,
                                                           std::chrono::seconds timeout) = 0;
};

class PrivilegedCommandRunner final : public ICommandRunner {
public:
  explicit PrivilegedCommandRunner(std::vector<std::string> prefix);

  [[nodiscard]] common::Result<CommandOutcome> run(const HealingAction &action,
                                                   std::chrono::seconds timeout) override;

  [[nodiscard]] std::vector<std::string> full_argv(const std::vector<std::string> &argv) const;

private:
  std::vector<std::string> prefix_;
};

} // namespace hostwarden::healing
