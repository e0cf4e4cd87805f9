#pragma once

#include "hostwarden/common/result.hpp"
#include "hostwarden/monitor/agent.hpp"

#include <filesystem>
#include <string>

namespace hostwarden::daemon {

class StateWriter {
public:
  explicit StateWriter(std::filesystem::path state_file);

  [[nodiscard]] common::Status write(const monitor::CycleReport &report,
                                     monitor::AgentState state) const;

  [[nodiscard]] static std::string render(const monitor::CycleReport &report,
                                          monitor::AgentState state);

  [[nodiscard]] const std::filesystem::path &path() const { return state_file_; }

private:
  std::filesystem::path state_file_;
};

} // namespace hostwarden::daemon
