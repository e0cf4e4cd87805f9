#include "hostwarden/monitor/collector.hpp"

#include "hostwarden/observability/global.hpp"

#include <future>
#include <optional>
#include <stdexcept>

namespace hostwarden::monitor {

namespace {

template <typename T, typename Fn>
std::optional<std::future<common::Result<T>>> launch(const bool enabled, const std::string &check,
                                                     Fn fn) {
  if (!enabled) {
    return std::nullopt;
  }
  return std::async(std::launch::async, [check, fn = std::move(fn)]() -> common::Result<T> {
    const auto started = std::chrono::steady_clock::now();
    common::Result<T> result = common::Result<T>::failure("not collected",
                                                          common::ErrorKind::Collection);
    try {
      result = fn();
    } catch (const std::exception &e) {
      result = common::Result<T>::failure(check + " check threw: " + e.what(),
                                          common::ErrorKind::Collection);
    }
    observability::record_check_latency(
        check, std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started));
    if (!result.ok()) {
      observability::log_warn("collector", check + ": " + result.error());
    }
    return result;
  });
}

template <typename T>
std::optional<common::Result<T>> join(std::optional<std::future<common::Result<T>>> &pending) {
  if (!pending.has_value()) {
    return std::nullopt;
  }
  return pending->get();
}

} // namespace

metrics::MetricSnapshot collect_snapshot(metrics::IMetricSource &source,
                                         const config::Config &config) {
  metrics::MetricSnapshot snapshot;
  snapshot.taken_at = std::chrono::system_clock::now();

  const bool want_processes = config.checks.processes ||
                              (config.checks.cpu && config.self_heal.enabled &&
                               config.self_heal.cpu.enabled);

  auto cpu = launch<metrics::CpuReading>(config.checks.cpu, "cpu",
                                         [&source] { return source.read_cpu(); });
  auto memory = launch<metrics::MemoryReading>(config.checks.memory, "memory",
                                               [&source] { return source.read_memory(); });
  auto disk = launch<metrics::DiskReading>(config.checks.disk, "disk", [&source, &config] {
    return source.read_disk(config.disk.filesystem);
  });
  auto network = launch<metrics::NetworkReading>(
      config.network.enabled, "network", [&source, &config]() -> common::Result<metrics::NetworkReading> {
        const auto reachable = source.ping_check(
            config.network.host, std::chrono::seconds(config.network.timeout_secs));
        if (!reachable.ok()) {
          return common::Result<metrics::NetworkReading>::failure(reachable.error(),
                                                                  common::ErrorKind::Collection);
        }
        return common::Result<metrics::NetworkReading>::success(
            metrics::NetworkReading{.host = config.network.host, .reachable = reachable.value()});
      });
  auto service = launch<metrics::ServiceReading>(
      config.service.enabled, "service", [&source, &config]() -> common::Result<metrics::ServiceReading> {
        const auto running = source.process_present(config.service.process_name);
        if (!running.ok()) {
          return common::Result<metrics::ServiceReading>::failure(running.error(),
                                                                  common::ErrorKind::Collection);
        }
        const auto state = source.service_state(config.service.service_name);
        if (!state.ok()) {
          return common::Result<metrics::ServiceReading>::failure(state.error(),
                                                                  common::ErrorKind::Collection);
        }
        return common::Result<metrics::ServiceReading>::success(
            metrics::ServiceReading{.process_name = config.service.process_name,
                                    .service_name = config.service.service_name,
                                    .process_running = running.value(),
                                    .state = state.value()});
      });
  auto port = launch<metrics::PortReading>(config.port.enabled, "port", [&source, &config] {
    return source.port_state(config.port.port);
  });
  auto processes = launch<metrics::ProcessTableReading>(
      want_processes, "processes", [&source] { return source.read_processes(kTopProcessCount); });
  auto temperature = launch<metrics::TemperatureReading>(
      config.checks.temperature, "temperature", [&source] { return source.read_temperatures(); });

  snapshot.cpu = join(cpu);
  snapshot.memory = join(memory);
  snapshot.disk = join(disk);
  snapshot.network = join(network);
  snapshot.service = join(service);
  snapshot.port = join(port);
  snapshot.processes = join(processes);
  snapshot.temperature = join(temperature);

  if (snapshot.cpu.has_value() && snapshot.cpu->ok()) {
    observability::record_reading("cpu_percent", snapshot.cpu->value().percent);
  }
  if (snapshot.memory.has_value() && snapshot.memory->ok()) {
    observability::record_reading("memory_percent", snapshot.memory->value().percent);
  }
  if (snapshot.disk.has_value() && snapshot.disk->ok()) {
    observability::record_reading("disk_percent", snapshot.disk->value().percent);
  }
  return snapshot;
}

} // namespace hostwarden::monitor
