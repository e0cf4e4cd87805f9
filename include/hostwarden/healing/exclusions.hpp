#pragma once

#include "hostwarden/config/schema.hpp"
#include "hostwarden/metrics/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace hostwarden::healing {

/// Targets remediation must never touch. Each check returns the refusal reason, or
/// nullopt when the target is allowed.
class ExclusionSet {
public:
  /// `monitored_process` is the workload the agent keeps alive; it is never killed.
  ExclusionSet(const config::SelfHealConfig &config, int own_pid,
               const std::string &monitored_process);

  [[nodiscard]] std::optional<std::string> refuse_process(const metrics::ProcessSample &sample) const;
  [[nodiscard]] std::optional<std::string> refuse_service(const std::string &service) const;
  [[nodiscard]] std::optional<std::string> refuse_path(const std::string &path,
                                                       std::uint32_t max_age_days) const;

private:
  void exclude_process_name(const std::string &name);
  [[nodiscard]] bool process_name_excluded(const std::string &name) const;

  std::set<std::string> process_names_;
  std::set<std::string> truncated_names_;
  std::set<std::string> users_;
  std::set<std::int64_t> pids_;
  std::set<std::string> services_;
  std::set<std::string> protected_paths_;
  bool allow_root_ = false;
  std::uint32_t max_age_limit_days_ = 0;
  int own_pid_ = 0;
};

[[nodiscard]] std::string canonical_unit_name(const std::string &service);

} // namespace hostwarden::healing
