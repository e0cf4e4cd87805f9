#pragma once

#include "hostwarden/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace hostwarden::common {

struct ProcessOptions {
  std::chrono::milliseconds timeout{30'000};
  std::string stdin_data;
  // After the timeout the process group gets SIGTERM, then SIGKILL once this elapses.
  std::chrono::milliseconds term_grace{2'000};
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

/// Runs argv[0] from PATH without a shell. The child gets its own process group and a
/// clean signal mask; on timeout the whole group is killed. A failure Result means the
/// program could not be started at all; a non-zero exit is reported in the result.
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                const ProcessOptions &options = {});

[[nodiscard]] std::string join_command(const std::vector<std::string> &argv);

} // namespace hostwarden::common
