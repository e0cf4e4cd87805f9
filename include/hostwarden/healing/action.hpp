#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hostwarden::healing {

struct RestartService {
  std::string service;
};

struct KillProcess {
  int pid = 0;
  std::string name;
  std::string user;
};

struct DropCaches {};

enum class AgeBasis {
  Modified,
  Accessed,
};

struct DeleteStaleFiles {
  std::string path;
  std::uint32_t max_age_days = 0;
  AgeBasis basis = AgeBasis::Modified;
};

struct RunMandb {};

using HealingAction =
    std::variant<RestartService, KillProcess, DropCaches, DeleteStaleFiles, RunMandb>;

[[nodiscard]] std::string_view action_name(const HealingAction &action);
[[nodiscard]] std::string describe(const HealingAction &action);

[[nodiscard]] std::vector<std::vector<std::string>> command_plan(const HealingAction &action);

} // namespace hostwarden::healing
