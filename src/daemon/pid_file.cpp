#include "hostwarden/daemon/pid_file.hpp"

#include "hostwarden/common/fs.hpp"

#include <cerrno>
#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace hostwarden::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return common::Status::error("failed to create pid directory: " + ec.message());
  }

  if (const auto existing = running_pid(path_)) {
    if (*existing != static_cast<int>(getpid())) {
      return common::Status::error("hostwarden already running with pid " +
                                   std::to_string(*existing));
    }
  }

  const auto written = common::write_file_atomic(path_, std::to_string(getpid()) + "\n");
  if (!written.ok()) {
    return common::Status::error("failed to write pid file: " + written.error());
  }
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

std::optional<int> PidFile::running_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  int pid = 0;
  in >> pid;
  if (pid > 0 && is_process_running(pid)) {
    return pid;
  }
  return std::nullopt;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM still means the process exists.
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace hostwarden::daemon
