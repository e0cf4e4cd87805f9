#pragma once

#include "hostwarden/metrics/source.hpp"

#include <chrono>
#include <filesystem>

namespace hostwarden::metrics {

struct ProcfsOptions {
  std::filesystem::path proc_root = "/proc";
  std::filesystem::path sys_root = "/sys";
  std::chrono::milliseconds sample_window{1000};
};

class ProcMetricSource final : public IMetricSource {
public:
  explicit ProcMetricSource(ProcfsOptions options = {});

  [[nodiscard]] common::Result<CpuReading> read_cpu() override;
  [[nodiscard]] common::Result<MemoryReading> read_memory() override;
  [[nodiscard]] common::Result<DiskReading> read_disk(const std::string &filesystem) override;
  [[nodiscard]] common::Result<bool> ping_check(const std::string &host,
                                                std::chrono::seconds timeout) override;
  [[nodiscard]] common::Result<ServiceState> service_state(const std::string &name) override;
  [[nodiscard]] common::Result<bool> process_present(const std::string &name) override;
  [[nodiscard]] common::Result<PortReading> port_state(std::uint16_t port) override;
  [[nodiscard]] common::Result<ProcessTableReading> read_processes(std::size_t top_n) override;
  [[nodiscard]] common::Result<TemperatureReading> read_temperatures() override;

  [[nodiscard]] std::string_view name() const override { return "procfs"; }

private:
  [[nodiscard]] std::filesystem::path proc(const std::string &relative) const;

  ProcfsOptions options_;
};

} // namespace hostwarden::metrics
