#pragma once

#include "hostwarden/metrics/snapshot.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hostwarden::diagnostics {

/// Ordered by severity; the overall status of a cycle is the maximum.
enum class HealthStatus {
  Nominal = 0,
  Warning = 1,
  Critical = 2,
  Error = 3,
};

[[nodiscard]] std::string_view status_name(HealthStatus status);

enum class Subsystem {
  Cpu,
  Memory,
  Disk,
  Network,
  Service,
  Port,
  Processes,
  Temperature,
};

[[nodiscard]] std::string_view subsystem_name(Subsystem subsystem);

struct Finding {
  std::string alert_key;
  HealthStatus status = HealthStatus::Warning;
  std::string summary;
  std::string detail;
};

struct SubsystemResult {
  Subsystem subsystem = Subsystem::Cpu;
  HealthStatus status = HealthStatus::Nominal;
  std::string detail;
  std::vector<Finding> findings;
  bool heal_eligible = false;
  std::vector<metrics::ProcessSample> offenders;
  double observed_value = 0.0;

  [[nodiscard]] bool has_finding(const std::string &alert_key) const;
};

struct DiagnosticResult {
  std::vector<SubsystemResult> subsystems;
  HealthStatus overall = HealthStatus::Nominal;

  [[nodiscard]] const SubsystemResult *find(Subsystem subsystem) const;
  [[nodiscard]] std::size_t finding_count() const;
};

} // namespace hostwarden::diagnostics
