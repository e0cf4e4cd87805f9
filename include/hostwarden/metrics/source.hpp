#pragma once

#include "hostwarden/common/result.hpp"
#include "hostwarden/metrics/snapshot.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace hostwarden::metrics {

/// Read-only access to the host. Implementations hold no per-cycle state and may be
/// called from several threads at once.
class IMetricSource {
public:
  virtual ~IMetricSource() = default;

  [[nodiscard]] virtual common::Result<CpuReading> read_cpu() = 0;
  [[nodiscard]] virtual common::Result<MemoryReading> read_memory() = 0;
  [[nodiscard]] virtual common::Result<DiskReading> read_disk(const std::string &filesystem) = 0;
  [[nodiscard]] virtual common::Result<bool> ping_check(const std::string &host,
                                                        std::chrono::seconds timeout) = 0;
  [[nodiscard]] virtual common::Result<ServiceState> service_state(const std::string &name) = 0;
  [[nodiscard]] virtual common::Result<bool> process_present(const std::string &name) = 0;
  [[nodiscard]] virtual common::Result<PortReading> port_state(std::uint16_t port) = 0;
  [[nodiscard]] virtual common::Result<ProcessTableReading> read_processes(std::size_t top_n) = 0;
  [[nodiscard]] virtual common::Result<TemperatureReading> read_temperatures() = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hostwarden::metrics
