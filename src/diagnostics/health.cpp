#include "hostwarden/diagnostics/health.hpp"

#include <algorithm>

namespace hostwarden::diagnostics {

std::string_view status_name(const HealthStatus status) {
  switch (status) {
  case HealthStatus::Nominal:
    return "NOMINAL";
  case HealthStatus::Warning:
    return "WARNING";
  case HealthStatus::Critical:
    return "CRITICAL";
  case HealthStatus::Error:
    return "ERROR";
  }
  return "ERROR";
}

std::string_view subsystem_name(const Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::Cpu:
    return "cpu";
  case Subsystem::Memory:
    return "memory";
  case Subsystem::Disk:
    return "disk";
  case Subsystem::Network:
    return "network";
  case Subsystem::Service:
    return "service";
  case Subsystem::Port:
    return "port";
  case Subsystem::Processes:
    return "processes";
  case Subsystem::Temperature:
    return "temperature";
  }
  return "unknown";
}

bool SubsystemResult::has_finding(const std::string &alert_key) const {
  return std::any_of(findings.begin(), findings.end(),
                     [&](const Finding &finding) { return finding.alert_key == alert_key; });
}

const SubsystemResult *DiagnosticResult::find(const Subsystem subsystem) const {
  for (const auto &result : subsystems) {
    if (result.subsystem == subsystem) {
      return &result;
    }
  }
  return nullptr;
}

std::size_t DiagnosticResult::finding_count() const {
  std::size_t count = 0;
  for (const auto &result : subsystems) {
    count += result.findings.size();
  }
  return count;
}

} // namespace hostwarden::diagnostics
