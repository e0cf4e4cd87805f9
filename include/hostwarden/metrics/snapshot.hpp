#pragma once

#include "hostwarden/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hostwarden::metrics {

struct CpuReading {
  double percent = 0.0;
  double load_1m = 0.0;
  unsigned cores = 1;
};

struct MemoryReading {
  double percent = 0.0;
  std::uint64_t used_mb = 0;
  std::uint64_t total_mb = 0;
  double swap_percent = 0.0;
};

struct DiskReading {
  std::string filesystem;
  double percent = 0.0;
  std::uint64_t available_mb = 0;
};

struct NetworkReading {
  std::string host;
  bool reachable = false;
};

enum class ServiceState {
  Active,
  Inactive,
  Unknown,
};

[[nodiscard]] std::string_view service_state_name(ServiceState state);

struct ServiceReading {
  std::string process_name;
  std::string service_name;
  bool process_running = false;
  ServiceState state = ServiceState::Unknown;
};

struct PortReading {
  std::uint16_t port = 0;
  bool listening = false;
  std::vector<std::string> addresses;

  [[nodiscard]] std::string bound_ip() const { return addresses.empty() ? "" : addresses.front(); }
};

struct ProcessSample {
  int pid = 0;
  std::string name;
  unsigned uid = 0;
  std::string user;
  double cpu_percent = 0.0;
  double age_seconds = 0.0;
};

struct ProcessTableReading {
  std::size_t total = 0;
  std::size_t zombies = 0;
  std::vector<ProcessSample> top_cpu;
};

struct TemperatureSensor {
  std::string name;
  double celsius = 0.0;
};

struct TemperatureReading {
  std::vector<TemperatureSensor> sensors;
};

/// One cycle's readings. A disabled check is absent (nullopt); a failed one holds a
/// collection error instead of a value.
struct MetricSnapshot {
  std::chrono::system_clock::time_point taken_at{};
  std::optional<common::Result<CpuReading>> cpu;
  std::optional<common::Result<MemoryReading>> memory;
  std::optional<common::Result<DiskReading>> disk;
  std::optional<common::Result<NetworkReading>> network;
  std::optional<common::Result<ServiceReading>> service;
  std::optional<common::Result<PortReading>> port;
  std::optional<common::Result<ProcessTableReading>> processes;
  std::optional<common::Result<TemperatureReading>> temperature;
};

} // namespace hostwarden::metrics
