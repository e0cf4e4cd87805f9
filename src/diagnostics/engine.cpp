#include "hostwarden/diagnostics/engine.hpp"

#include "hostwarden/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace hostwarden::diagnostics {

namespace keys {

std::string disk_high(const std::string &filesystem) { return "DISK_HIGH_" + filesystem; }

std::string service_state(const std::string &service) { return "PROC_SVC_STATE_" + service; }

std::string port_unexpected_listen(const std::uint16_t port) {
  return "PORT_UNEXPECTED_LISTEN_" + std::to_string(port);
}

std::string port_unexpected_clear(const std::uint16_t port) {
  return "PORT_UNEXPECTED_CLEAR_" + std::to_string(port);
}

std::string port_wrong_ip(const std::uint16_t port) {
  return "PORT_WRONG_IP_" + std::to_string(port);
}

std::string collection_error(const Subsystem subsystem) {
  std::string name(subsystem_name(subsystem));
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return "COLLECTION_ERROR_" + name;
}

} // namespace keys

namespace {

std::string fixed1(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value;
  return out.str();
}

Finding warning(std::string key, std::string summary, std::string detail) {
  return Finding{.alert_key = std::move(key),
                 .status = HealthStatus::Warning,
                 .summary = std::move(summary),
                 .detail = std::move(detail)};
}

template <typename T>
bool collection_failed(const common::Result<T> &reading, const Subsystem subsystem,
                       SubsystemResult &out) {
  if (reading.ok()) {
    return false;
  }
  out.status = HealthStatus::Error;
  out.detail = "reading unavailable: " + reading.error();
  out.findings.push_back(Finding{.alert_key = keys::collection_error(subsystem),
                                 .status = HealthStatus::Error,
                                 .summary = std::string(subsystem_name(subsystem)) +
                                            " reading unavailable",
                                 .detail = reading.error()});
  return true;
}

void settle_status(SubsystemResult &result) {
  if (result.status == HealthStatus::Error) {
    return;
  }
  result.status = HealthStatus::Nominal;
  for (const auto &finding : result.findings) {
    result.status = std::max(result.status, finding.status);
  }
}

SubsystemResult diagnose_cpu(const common::Result<metrics::CpuReading> &reading,
                             const DiagnosticPolicy &policy,
                             const std::optional<common::Result<metrics::ProcessTableReading>>
                                 &processes) {
  SubsystemResult out{.subsystem = Subsystem::Cpu};
  if (collection_failed(reading, Subsystem::Cpu, out)) {
    return out;
  }
  const auto &cpu = reading.value();
  const double limit = policy.thresholds.cpu_percent;
  const double load_limit = policy.thresholds.load_per_core * static_cast<double>(cpu.cores);
  out.observed_value = cpu.percent;
  out.detail = "usage " + fixed1(cpu.percent) + "%, load " + fixed1(cpu.load_1m) + " on " +
               std::to_string(cpu.cores) + " cores";

  if (cpu.percent > limit) {
    out.findings.push_back(warning(keys::kCpuHigh,
                                   "CPU usage " + fixed1(cpu.percent) + "% above " +
                                       fixed1(limit) + "%",
                                   out.detail));
    out.heal_eligible = true;
    if (processes.has_value() && processes->ok()) {
      for (const auto &sample : processes->value().top_cpu) {
        if (sample.cpu_percent > limit) {
          out.offenders.push_back(sample);
        }
      }
    }
  }
  if (cpu.load_1m > load_limit) {
    out.findings.push_back(warning(keys::kLoadHigh,
                                   "load average " + fixed1(cpu.load_1m) + " above " +
                                       fixed1(load_limit),
                                   out.detail));
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_memory(const common::Result<metrics::MemoryReading> &reading,
                                const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Memory};
  if (collection_failed(reading, Subsystem::Memory, out)) {
    return out;
  }
  const auto &memory = reading.value();
  out.detail = "memory " + fixed1(memory.percent) + "% (" + std::to_string(memory.used_mb) + "/" +
               std::to_string(memory.total_mb) + " MB), swap " + fixed1(memory.swap_percent) + "%";
  if (memory.percent > policy.thresholds.memory_percent) {
    out.findings.push_back(warning(keys::kMemHigh,
                                   "memory usage " + fixed1(memory.percent) + "% above " +
                                       fixed1(policy.thresholds.memory_percent) + "%",
                                   out.detail));
  }
  if (memory.swap_percent > policy.thresholds.swap_percent) {
    out.findings.push_back(warning(keys::kSwapHigh,
                                   "swap usage " + fixed1(memory.swap_percent) + "% above " +
                                       fixed1(policy.thresholds.swap_percent) + "%",
                                   out.detail));
  }
  out.heal_eligible = !out.findings.empty();
  settle_status(out);
  return out;
}

SubsystemResult diagnose_disk(const common::Result<metrics::DiskReading> &reading,
                              const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Disk};
  if (collection_failed(reading, Subsystem::Disk, out)) {
    return out;
  }
  const auto &disk = reading.value();
  const std::string filesystem = disk.filesystem.empty() ? policy.disk_filesystem : disk.filesystem;
  out.detail = filesystem + " " + fixed1(disk.percent) + "% used, " +
               std::to_string(disk.available_mb) + " MB free";
  if (disk.percent > policy.thresholds.disk_percent) {
    out.findings.push_back(warning(keys::disk_high(filesystem),
                                   "disk usage on " + filesystem + " " + fixed1(disk.percent) +
                                       "% above " + fixed1(policy.thresholds.disk_percent) + "%",
                                   out.detail));
    out.heal_eligible = true;
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_network(const common::Result<metrics::NetworkReading> &reading) {
  SubsystemResult out{.subsystem = Subsystem::Network};
  if (collection_failed(reading, Subsystem::Network, out)) {
    return out;
  }
  const auto &network = reading.value();
  out.detail = network.host + (network.reachable ? " reachable" : " unreachable");
  if (!network.reachable) {
    out.findings.push_back(
        warning(keys::kNetDown, "network check failed: " + network.host + " unreachable",
                out.detail));
    out.heal_eligible = true;
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_service(const common::Result<metrics::ServiceReading> &reading,
                                 const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Service};
  if (collection_failed(reading, Subsystem::Service, out)) {
    return out;
  }
  const auto &service = reading.value();
  const bool active = service.state == metrics::ServiceState::Active;
  const std::string expected = policy.service_expected_active ? "active" : "inactive";
  out.detail = "process " + service.process_name +
               (service.process_running ? " running" : " not running") + ", " +
               service.service_name + " " + std::string(metrics::service_state_name(service.state)) +
               ", expected " + expected;

  const bool matches = policy.service_expected_active
                           ? (service.process_running && active)
                           : (!service.process_running && !active);
  if (!matches) {
    out.findings.push_back(warning(keys::service_state(service.service_name),
                                   service.service_name + " is not in expected state " + expected,
                                   out.detail));
    out.heal_eligible = policy.service_expected_active;
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_port(const common::Result<metrics::PortReading> &reading,
                              const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Port};
  if (collection_failed(reading, Subsystem::Port, out)) {
    return out;
  }
  const auto &port = reading.value();
  const std::string addresses = port.addresses.empty() ? "-" : common::join(port.addresses, ",");
  out.detail = "port " + std::to_string(port.port) +
               (port.listening ? " listening on " + addresses : " not listening");

  if (policy.port_expected_listening) {
    if (!port.listening) {
      out.findings.push_back(warning(keys::port_unexpected_clear(port.port),
                                     "port " + std::to_string(port.port) +
                                         " is not listening",
                                     out.detail));
    } else if (policy.expected_listen_ip != "any") {
      const bool wrong = std::any_of(port.addresses.begin(), port.addresses.end(),
                                     [&](const std::string &address) {
                                       return address != policy.expected_listen_ip;
                                     });
      if (wrong) {
        out.findings.push_back(warning(keys::port_wrong_ip(port.port),
                                       "port " + std::to_string(port.port) + " bound to " +
                                           addresses + ", expected " + policy.expected_listen_ip,
                                       out.detail));
      }
    }
  } else if (port.listening) {
    out.findings.push_back(warning(keys::port_unexpected_listen(port.port),
                                   "port " + std::to_string(port.port) +
                                       " is listening but expected clear",
                                   out.detail));
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_processes(const common::Result<metrics::ProcessTableReading> &reading,
                                   const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Processes};
  if (collection_failed(reading, Subsystem::Processes, out)) {
    return out;
  }
  const auto &table = reading.value();
  out.detail = std::to_string(table.total) + " processes, " + std::to_string(table.zombies) +
               " zombies";
  if (table.zombies > policy.thresholds.zombie_count) {
    out.findings.push_back(warning(keys::kZombiesHigh,
                                   std::to_string(table.zombies) + " zombie processes (limit " +
                                       std::to_string(policy.thresholds.zombie_count) + ")",
                                   out.detail));
  }
  settle_status(out);
  return out;
}

SubsystemResult diagnose_temperature(const common::Result<metrics::TemperatureReading> &reading,
                                     const DiagnosticPolicy &policy) {
  SubsystemResult out{.subsystem = Subsystem::Temperature};
  if (collection_failed(reading, Subsystem::Temperature, out)) {
    return out;
  }
  const auto &sensors = reading.value().sensors;
  if (sensors.empty()) {
    out.detail = "no sensors";
    return out;
  }
  std::vector<std::string> hot;
  double hottest = sensors.front().celsius;
  for (const auto &sensor : sensors) {
    hottest = std::max(hottest, sensor.celsius);
    if (sensor.celsius > policy.thresholds.temperature_celsius) {
      hot.push_back(sensor.name + "=" + fixed1(sensor.celsius) + "C");
    }
  }
  out.detail = std::to_string(sensors.size()) + " sensors, hottest " + fixed1(hottest) + "C";
  if (!hot.empty()) {
    out.findings.push_back(warning(keys::kTempHigh,
                                   "temperature above " +
                                       fixed1(policy.thresholds.temperature_celsius) + "C",
                                   common::join(hot, ", ")));
  }
  settle_status(out);
  return out;
}

} // namespace

DiagnosticPolicy DiagnosticPolicy::from_config(const config::Config &config) {
  DiagnosticPolicy policy;
  policy.thresholds = config.thresholds;
  policy.disk_filesystem = config.disk.filesystem;
  policy.network_host = config.network.host;
  policy.process_name = config.service.process_name;
  policy.service_name = config.service.service_name;
  policy.service_expected_active = config.service.expected_state != "inactive";
  policy.port = config.port.port;
  policy.port_expected_listening = config.port.expected_state != "clear";
  policy.expected_listen_ip = config.port.expected_listen_ip;
  return policy;
}

DiagnosticResult diagnose(const metrics::MetricSnapshot &snapshot, const DiagnosticPolicy &policy) {
  DiagnosticResult result;
  if (snapshot.cpu.has_value()) {
    result.subsystems.push_back(diagnose_cpu(*snapshot.cpu, policy, snapshot.processes));
  }
  if (snapshot.memory.has_value()) {
    result.subsystems.push_back(diagnose_memory(*snapshot.memory, policy));
  }
  if (snapshot.disk.has_value()) {
    result.subsystems.push_back(diagnose_disk(*snapshot.disk, policy));
  }
  if (snapshot.network.has_value()) {
    result.subsystems.push_back(diagnose_network(*snapshot.network));
  }
  if (snapshot.service.has_value()) {
    result.subsystems.push_back(diagnose_service(*snapshot.service, policy));
  }
  if (snapshot.port.has_value()) {
    result.subsystems.push_back(diagnose_port(*snapshot.port, policy));
  }
  if (snapshot.processes.has_value()) {
    result.subsystems.push_back(diagnose_processes(*snapshot.processes, policy));
  }
  if (snapshot.temperature.has_value()) {
    result.subsystems.push_back(diagnose_temperature(*snapshot.temperature, policy));
  }

  for (const auto &subsystem : result.subsystems) {
    result.overall = std::max(result.overall, subsystem.status);
  }
  return result;
}

} // namespace hostwarden::diagnostics
