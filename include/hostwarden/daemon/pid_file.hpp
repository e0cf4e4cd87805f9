#pragma once

#include "hostwarden/common/result.hpp"

#include <filesystem>
#include <optional>

namespace hostwarden::daemon {

/// Single-instance guard. acquire() fails while another live process owns the file; a
/// file left behind by a dead process is replaced.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] bool acquired() const { return acquired_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] static std::optional<int> running_pid(const std::filesystem::path &path);
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace hostwarden::daemon
