#pragma once

#include "hostwarden/alerts/cooldown.hpp"
#include "hostwarden/alerts/notifier.hpp"
#include "hostwarden/config/schema.hpp"
#include "hostwarden/healing/command_runner.hpp"
#include "hostwarden/metrics/source.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostwarden::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Defaults with every external probe off, no file logging and state under `workspace`.
config::Config quiet_config(const TempWorkspace &workspace);

/// Scripted readings. Every value is healthy until a test overrides it.
class FakeMetricSource final : public metrics::IMetricSource {
public:
  FakeMetricSource();

  common::Result<metrics::CpuReading> cpu;
  common::Result<metrics::MemoryReading> memory;
  common::Result<metrics::DiskReading> disk;
  common::Result<bool> reachable;
  common::Result<metrics::ServiceState> unit_state;
  common::Result<bool> process_running;
  common::Result<metrics::PortReading> port;
  common::Result<metrics::ProcessTableReading> processes;
  common::Result<metrics::TemperatureReading> temperature;
  // Makes read_memory() throw instead of returning.
  bool throw_on_memory = false;

  std::atomic<int> cpu_reads{0};
  std::atomic<int> process_reads{0};

  [[nodiscard]] common::Result<metrics::CpuReading> read_cpu() override;
  [[nodiscard]] common::Result<metrics::MemoryReading> read_memory() override;
  [[nodiscard]] common::Result<metrics::DiskReading> read_disk(const std::string &filesystem) override;
  [[nodiscard]] common::Result<bool> ping_check(const std::string &host,
                                                std::chrono::seconds timeout) override;
  [[nodiscard]] common::Result<metrics::ServiceState> service_state(const std::string &name) override;
  [[nodiscard]] common::Result<bool> process_present(const std::string &name) override;
  [[nodiscard]] common::Result<metrics::PortReading> port_state(std::uint16_t port) override;
  [[nodiscard]] common::Result<metrics::ProcessTableReading> read_processes(std::size_t top_n) override;
  [[nodiscard]] common::Result<metrics::TemperatureReading> read_temperatures() override;
  [[nodiscard]] std::string_view name() const override { return "fake"; }

  void set_cpu_percent(double percent);
};

class RecordingNotifier final : public alerts::INotifier {
public:
  [[nodiscard]] common::Status send(const alerts::AlertMessage &message) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  void fail_with(std::string error);
  void succeed();

  [[nodiscard]] std::vector<alerts::AlertMessage> sent() const;
  [[nodiscard]] std::size_t attempts() const;
  [[nodiscard]] std::size_t count(const std::string &alert_key) const;

private:
  mutable std::mutex mutex_;
  std::vector<alerts::AlertMessage> sent_;
  std::size_t attempts_ = 0;
  std::optional<std::string> error_;
};

class RecordingCommandRunner final : public healing::ICommandRunner {
public:
  [[nodiscard]] common::Result<healing::CommandOutcome>
  run(const healing::HealingAction &action, std::chrono::seconds timeout) override;

  [[nodiscard]] const std::vector<healing::HealingAction> &actions() const { return actions_; }

  // Applied to every run until changed.
  healing::CommandOutcome outcome;
  std::optional<std::string> launch_error;

private:
  std::vector<healing::HealingAction> actions_;
};

class ManualClock {
public:
  ManualClock();

  [[nodiscard]] alerts::SteadyTime now() const { return now_; }
  void advance(std::chrono::seconds by) { now_ += by; }
  [[nodiscard]] std::function<alerts::SteadyTime()> fn() const;

private:
  alerts::SteadyTime now_;
};

} // namespace hostwarden::testing
