#include "hostwarden/healing/action.hpp"

#include <type_traits>

namespace hostwarden::healing {

namespace {

template <typename> inline constexpr bool kAlwaysFalse = false;

} // namespace

std::string_view action_name(const HealingAction &action) {
  return std::visit(
      [](const auto &value) -> std::string_view {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, RestartService>) {
          return "RESTART_SERVICE";
        } else if constexpr (std::is_same_v<T, KillProcess>) {
          return "KILL_PROCESS";
        } else if constexpr (std::is_same_v<T, DropCaches>) {
          return "DROP_CACHES";
        } else if constexpr (std::is_same_v<T, DeleteStaleFiles>) {
          return "DELETE_STALE_FILES";
        } else if constexpr (std::is_same_v<T, RunMandb>) {
          return "RUN_MANDB";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled healing action");
        }
      },
      action);
}

std::string describe(const HealingAction &action) {
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, RestartService>) {
          return "restart service " + value.service;
        } else if constexpr (std::is_same_v<T, KillProcess>) {
          return "terminate process " + value.name + " (pid " + std::to_string(value.pid) +
                 (value.user.empty() ? "" : ", user " + value.user) + ")";
        } else if constexpr (std::is_same_v<T, DropCaches>) {
          return "flush dirty pages and drop page caches";
        } else if constexpr (std::is_same_v<T, DeleteStaleFiles>) {
          return "delete files under " + value.path + " not " +
                 (value.basis == AgeBasis::Accessed ? "accessed" : "modified") + " for " +
                 std::to_string(value.max_age_days) + " days";
        } else {
          return "rebuild the man page index";
        }
      },
      action);
}

std::vector<std::vector<std::string>> command_plan(const HealingAction &action) {
  return std::visit(
      [](const auto &value) -> std::vector<std::vector<std::string>> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, RestartService>) {
          return {{"systemctl", "restart", value.service}};
        } else if constexpr (std::is_same_v<T, KillProcess>) {
          return {{"kill", "-TERM", std::to_string(value.pid)}};
        } else if constexpr (std::is_same_v<T, DropCaches>) {
          return {{"sync"}, {"sysctl", "-w", "vm.drop_caches=3"}};
        } else if constexpr (std::is_same_v<T, DeleteStaleFiles>) {
          const std::string age_flag = value.basis == AgeBasis::Accessed ? "-atime" : "-mtime";
          return {{"find", value.path, "-xdev", "-type", "f", age_flag,
                   "+" + std::to_string(value.max_age_days), "-delete"}};
        } else {
          return {{"mandb", "-q"}};
        }
      },
      action);
}

} // namespace hostwarden::healing
