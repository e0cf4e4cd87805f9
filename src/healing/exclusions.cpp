#include "hostwarden/healing/exclusions.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/metrics/procfs.hpp"

#include <filesystem>

namespace hostwarden::healing {

namespace {

std::filesystem::path normalize_dir(const std::string &path) {
  auto normal = std::filesystem::path(path).lexically_normal();
  if (normal.has_relative_path() && normal.filename().empty()) {
    normal = normal.parent_path();
  }
  return normal;
}

} // namespace

std::string canonical_unit_name(const std::string &service) {
  const std::string trimmed = common::trim(service);
  if (trimmed.find('.') == std::string::npos) {
    return trimmed + ".service";
  }
  return trimmed;
}

ExclusionSet::ExclusionSet(const config::SelfHealConfig &config, const int own_pid,
                           const std::string &monitored_process)
    : pids_(config.excluded_pids.begin(), config.excluded_pids.end()),
      allow_root_(config.allow_root), max_age_limit_days_(config.max_age_limit_days),
      own_pid_(own_pid) {
  for (const auto &name : config.excluded_processes) {
    exclude_process_name(name);
  }
  exclude_process_name(monitored_process);
  for (const auto &user : config.excluded_users) {
    if (allow_root_ && user == "root") {
      continue;
    }
    users_.insert(user);
  }
  for (const auto &service : config.excluded_services) {
    services_.insert(canonical_unit_name(service));
  }
  for (const auto &path : config.protected_paths) {
    protected_paths_.insert(normalize_dir(path).string());
  }
}

void ExclusionSet::exclude_process_name(const std::string &name) {
  const auto lowered = common::to_lower(common::trim(name));
  if (lowered.empty()) {
    return;
  }
  process_names_.insert(lowered);
  if (lowered.size() > metrics::procfs::kCommLength) {
    truncated_names_.insert(lowered.substr(0, metrics::procfs::kCommLength));
  }
}

bool ExclusionSet::process_name_excluded(const std::string &name) const {
  const auto lowered = common::to_lower(name);
  if (process_names_.count(lowered) != 0) {
    return true;
  }
  return lowered.size() == metrics::procfs::kCommLength && truncated_names_.count(lowered) != 0;
}

std::optional<std::string> ExclusionSet::refuse_process(const metrics::ProcessSample &sample) const {
  if (sample.pid <= 1) {
    return "pid " + std::to_string(sample.pid) + " is init";
  }
  if (sample.pid == own_pid_) {
    return "pid " + std::to_string(sample.pid) + " is the agent itself";
  }
  if (pids_.count(sample.pid) != 0) {
    return "pid " + std::to_string(sample.pid) + " is excluded";
  }
  if (process_name_excluded(sample.name)) {
    return "process " + sample.name + " is excluded";
  }
  if (sample.uid == 0 && !allow_root_) {
    return "process " + sample.name + " is owned by root";
  }
  if (users_.count(sample.user) != 0) {
    return "user " + sample.user + " is excluded";
  }
  return std::nullopt;
}

std::optional<std::string> ExclusionSet::refuse_service(const std::string &service) const {
  if (common::trim(service).empty()) {
    return std::string("no service configured");
  }
  if (services_.count(canonical_unit_name(service)) != 0) {
    return "service " + service + " is excluded";
  }
  return std::nullopt;
}

std::optional<std::string> ExclusionSet::refuse_path(const std::string &path,
                                                     const std::uint32_t max_age_days) const {
  if (common::trim(path).empty()) {
    return std::string("no cleanup path configured");
  }
  const std::filesystem::path target(path);
  if (!target.is_absolute()) {
    return "path " + path + " is not absolute";
  }
  const auto normal = normalize_dir(path);
  for (const auto &protected_path : protected_paths_) {
    if (common::is_subpath(protected_path, normal)) {
      return "path " + normal.string() + " is protected";
    }
  }
  if (max_age_days < 1 || max_age_days > max_age_limit_days_) {
    return "age " + std::to_string(max_age_days) + " days is outside [1, " +
           std::to_string(max_age_limit_days_) + "]";
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(normal, ec)) {
    return "path " + normal.string() + " does not exist";
  }
  return std::nullopt;
}

} // namespace hostwarden::healing
