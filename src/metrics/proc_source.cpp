#include "hostwarden/metrics/proc_source.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/process.hpp"
#include "hostwarden/metrics/procfs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <unordered_map>

#include <pwd.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace hostwarden::metrics {

namespace {

template <typename T> common::Result<T> collection_failure(const std::string &message) {
  return common::Result<T>::failure(message, common::ErrorKind::Collection);
}

bool is_pid_dir(const std::string &name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

std::string user_name(const unsigned uid) {
  struct passwd pwd {};
  struct passwd *found = nullptr;
  char buffer[1024];
  if (getpwuid_r(uid, &pwd, buffer, sizeof(buffer), &found) == 0 && found != nullptr) {
    return found->pw_name;
  }
  return std::to_string(uid);
}

struct PidTicks {
  std::uint64_t ticks = 0;
  procfs::ProcStat stat;
};

} // namespace

std::string_view service_state_name(const ServiceState state) {
  switch (state) {
  case ServiceState::Active:
    return "active";
  case ServiceState::Inactive:
    return "inactive";
  case ServiceState::Unknown:
    return "unknown";
  }
  return "unknown";
}

ProcMetricSource::ProcMetricSource(ProcfsOptions options) : options_(std::move(options)) {}

std::filesystem::path ProcMetricSource::proc(const std::string &relative) const {
  return options_.proc_root / relative;
}

common::Result<CpuReading> ProcMetricSource::read_cpu() {
  const auto first = common::read_file(proc("stat"));
  if (!first.ok()) {
    return collection_failure<CpuReading>(first.error());
  }
  const auto before = procfs::parse_cpu_times(first.value());
  if (!before.has_value()) {
    return collection_failure<CpuReading>("unparseable cpu line in " + proc("stat").string());
  }

  std::this_thread::sleep_for(options_.sample_window);

  const auto second = common::read_file(proc("stat"));
  if (!second.ok()) {
    return collection_failure<CpuReading>(second.error());
  }
  const auto after = procfs::parse_cpu_times(second.value());
  if (!after.has_value()) {
    return collection_failure<CpuReading>("unparseable cpu line in " + proc("stat").string());
  }
  const auto busy = procfs::busy_percent(*before, *after);
  if (!busy.has_value()) {
    return collection_failure<CpuReading>("no cpu time elapsed between samples");
  }

  CpuReading reading;
  reading.percent = *busy;
  reading.cores = procfs::count_cpus(second.value());
  const auto loadavg = common::read_file(proc("loadavg"));
  if (loadavg.ok()) {
    reading.load_1m = procfs::parse_load1(loadavg.value()).value_or(0.0);
  }
  return common::Result<CpuReading>::success(reading);
}

common::Result<MemoryReading> ProcMetricSource::read_memory() {
  const auto text = common::read_file(proc("meminfo"));
  if (!text.ok()) {
    return collection_failure<MemoryReading>(text.error());
  }
  const auto info = procfs::parse_meminfo(text.value());
  if (!info.has_value()) {
    return collection_failure<MemoryReading>("MemTotal missing from " + proc("meminfo").string());
  }

  MemoryReading reading;
  const std::uint64_t used_kb = info->total_kb - info->available_kb;
  reading.percent = static_cast<double>(used_kb) * 100.0 / static_cast<double>(info->total_kb);
  reading.used_mb = used_kb / 1024;
  reading.total_mb = info->total_kb / 1024;
  if (info->swap_total_kb > 0) {
    const std::uint64_t swap_free = std::min(info->swap_free_kb, info->swap_total_kb);
    reading.swap_percent = static_cast<double>(info->swap_total_kb - swap_free) * 100.0 /
                           static_cast<double>(info->swap_total_kb);
  }
  return common::Result<MemoryReading>::success(reading);
}

common::Result<DiskReading> ProcMetricSource::read_disk(const std::string &filesystem) {
  struct statvfs stats {};
  if (statvfs(filesystem.c_str(), &stats) != 0) {
    return collection_failure<DiskReading>("statvfs(" + filesystem +
                                           "): " + std::strerror(errno));
  }
  const auto block = static_cast<double>(stats.f_frsize != 0 ? stats.f_frsize : stats.f_bsize);
  const double used = static_cast<double>(stats.f_blocks - stats.f_bfree) * block;
  const double available = static_cast<double>(stats.f_bavail) * block;
  if (used + available <= 0.0) {
    return collection_failure<DiskReading>(filesystem + " reports no capacity");
  }

  DiskReading reading;
  reading.filesystem = filesystem;
  // Same rounding base as df's Use%: reserved blocks are excluded.
  reading.percent = used * 100.0 / (used + available);
  reading.available_mb = static_cast<std::uint64_t>(available / (1024.0 * 1024.0));
  return common::Result<DiskReading>::success(reading);
}

common::Result<bool> ProcMetricSource::ping_check(const std::string &host,
                                                  const std::chrono::seconds timeout) {
  common::ProcessOptions options;
  options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout) +
                    std::chrono::seconds(2);
  const auto result = common::run_process(
      {"ping", "-c", "1", "-W", std::to_string(timeout.count()), host}, options);
  if (!result.ok()) {
    return collection_failure<bool>(result.error());
  }
  return common::Result<bool>::success(!result.value().timed_out &&
                                       result.value().exit_code == 0);
}

common::Result<ServiceState> ProcMetricSource::service_state(const std::string &name) {
  common::ProcessOptions options;
  options.timeout = std::chrono::seconds(10);
  const auto result = common::run_process({"systemctl", "is-active", name}, options);
  if (!result.ok()) {
    return collection_failure<ServiceState>(result.error());
  }
  if (result.value().timed_out) {
    return collection_failure<ServiceState>("systemctl is-active " + name + " timed out");
  }

  const std::string state = common::trim(result.value().stdout_text);
  if (state == "active" || state == "reloading") {
    return common::Result<ServiceState>::success(ServiceState::Active);
  }
  if (state == "inactive" || state == "failed" || state == "activating" ||
      state == "deactivating" || state == "maintenance") {
    return common::Result<ServiceState>::success(ServiceState::Inactive);
  }
  if (state == "unknown") {
    return common::Result<ServiceState>::success(ServiceState::Unknown);
  }
  const std::string reason = common::trim(result.value().stderr_text);
  return collection_failure<ServiceState>("systemctl is-active " + name + " failed" +
                                          (reason.empty() ? "" : ": " + reason));
}

common::Result<bool> ProcMetricSource::process_present(const std::string &name) {
  std::error_code ec;
  std::filesystem::directory_iterator it(options_.proc_root, ec);
  if (ec) {
    return collection_failure<bool>("cannot list " + options_.proc_root.string() + ": " +
                                     ec.message());
  }

  const std::string self = std::to_string(getpid());
  for (const auto &entry : it) {
    const std::string pid = entry.path().filename().string();
    if (!is_pid_dir(pid) || pid == self) {
      continue;
    }
    const auto comm = common::read_file(entry.path() / "comm");
    if (comm.ok() && common::trim(comm.value()) == name) {
      return common::Result<bool>::success(true);
    }
    const auto cmdline = common::read_file(entry.path() / "cmdline");
    if (cmdline.ok() && procfs::decode_cmdline(cmdline.value()).find(name) != std::string::npos) {
      return common::Result<bool>::success(true);
    }
  }
  return common::Result<bool>::success(false);
}

common::Result<PortReading> ProcMetricSource::port_state(const std::uint16_t port) {
  const auto tcp = common::read_file(proc("net/tcp"));
  const auto tcp6 = common::read_file(proc("net/tcp6"));
  if (!tcp.ok() && !tcp6.ok()) {
    return collection_failure<PortReading>(tcp.error());
  }

  PortReading reading;
  reading.port = port;
  const auto collect = [&](const common::Result<std::string> &text, const bool ipv6) {
    if (!text.ok()) {
      return;
    }
    for (const auto &socket : procfs::parse_listen_sockets(text.value(), ipv6)) {
      if (socket.port != port) {
        continue;
      }
      const std::string address = procfs::normalize_listen_address(socket.address);
      if (std::find(reading.addresses.begin(), reading.addresses.end(), address) ==
          reading.addresses.end()) {
        reading.addresses.push_back(address);
      }
    }
  };
  collect(tcp, false);
  collect(tcp6, true);
  reading.listening = !reading.addresses.empty();
  return common::Result<PortReading>::success(std::move(reading));
}

common::Result<ProcessTableReading> ProcMetricSource::read_processes(const std::size_t top_n) {
  const auto scan = [this]() -> common::Result<std::unordered_map<int, PidTicks>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(options_.proc_root, ec);
    if (ec) {
      return common::Result<std::unordered_map<int, PidTicks>>::failure(
          "cannot list " + options_.proc_root.string() + ": " + ec.message(),
          common::ErrorKind::Collection);
    }
    std::unordered_map<int, PidTicks> out;
    for (const auto &entry : it) {
      if (!is_pid_dir(entry.path().filename().string())) {
        continue;
      }
      const auto text = common::read_file(entry.path() / "stat");
      if (!text.ok()) {
        continue;
      }
      const auto stat = procfs::parse_proc_stat(text.value());
      if (!stat.has_value()) {
        continue;
      }
      out[stat->pid] = PidTicks{.ticks = stat->utime + stat->stime, .stat = *stat};
    }
    return common::Result<std::unordered_map<int, PidTicks>>::success(std::move(out));
  };

  const auto before = scan();
  if (!before.ok()) {
    return collection_failure<ProcessTableReading>(before.error());
  }
  const auto started = std::chrono::steady_clock::now();
  std::this_thread::sleep_for(options_.sample_window);
  const auto after = scan();
  if (!after.ok()) {
    return collection_failure<ProcessTableReading>(after.error());
  }
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

  const long ticks_per_second = sysconf(_SC_CLK_TCK);
  const double hz = ticks_per_second > 0 ? static_cast<double>(ticks_per_second) : 100.0;
  double uptime = 0.0;
  if (const auto text = common::read_file(proc("uptime")); text.ok()) {
    uptime = procfs::parse_uptime(text.value()).value_or(0.0);
  }

  ProcessTableReading reading;
  reading.total = after.value().size();
  std::vector<ProcessSample> samples;
  for (const auto &[pid, current] : after.value()) {
    if (current.stat.state == 'Z') {
      ++reading.zombies;
      continue;
    }
    const auto prior = before.value().find(pid);
    if (prior == before.value().end() || prior->second.stat.starttime != current.stat.starttime ||
        elapsed <= 0.0) {
      continue;
    }
    const double delta = static_cast<double>(current.ticks - std::min(current.ticks,
                                                                      prior->second.ticks));
    ProcessSample sample;
    sample.pid = pid;
    sample.name = current.stat.comm;
    sample.cpu_percent = delta / hz / elapsed * 100.0;
    sample.age_seconds = uptime - static_cast<double>(current.stat.starttime) / hz;
    if (sample.age_seconds < 0.0) {
      sample.age_seconds = 0.0;
    }
    samples.push_back(std::move(sample));
  }

  std::sort(samples.begin(), samples.end(), [](const ProcessSample &a, const ProcessSample &b) {
    return a.cpu_percent > b.cpu_percent;
  });
  if (samples.size() > top_n) {
    samples.resize(top_n);
  }
  for (auto &sample : samples) {
    const auto status = common::read_file(proc(std::to_string(sample.pid) + "/status"));
    if (status.ok()) {
      sample.uid = procfs::parse_status_uid(status.value()).value_or(0);
    }
    sample.user = user_name(sample.uid);
    if (sample.name.size() == procfs::kCommLength) {
      const auto cmdline = common::read_file(proc(std::to_string(sample.pid) + "/cmdline"));
      if (cmdline.ok()) {
        const auto program = procfs::program_name(cmdline.value());
        if (program.size() > procfs::kCommLength && program.compare(0, procfs::kCommLength, sample.name) == 0) {
          sample.name = program;
        }
      }
    }
  }
  reading.top_cpu = std::move(samples);
  return common::Result<ProcessTableReading>::success(std::move(reading));
}

common::Result<TemperatureReading> ProcMetricSource::read_temperatures() {
  const auto thermal = options_.sys_root / "class" / "thermal";
  TemperatureReading reading;
  std::error_code ec;
  if (!std::filesystem::exists(thermal, ec)) {
    return common::Result<TemperatureReading>::success(std::move(reading));
  }
  std::filesystem::directory_iterator it(thermal, ec);
  if (ec) {
    return collection_failure<TemperatureReading>("cannot list " + thermal.string() + ": " +
                                                  ec.message());
  }

  std::size_t zones = 0;
  for (const auto &entry : it) {
    const std::string zone = entry.path().filename().string();
    if (!common::starts_with(zone, "thermal_zone")) {
      continue;
    }
    ++zones;
    const auto temp = common::read_file(entry.path() / "temp");
    if (!temp.ok()) {
      continue;
    }
    char *end = nullptr;
    const std::string text = common::trim(temp.value());
    const long millidegrees = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end == text.c_str()) {
      continue;
    }
    const auto type = common::read_file(entry.path() / "type");
    reading.sensors.push_back(TemperatureSensor{
        .name = type.ok() ? common::trim(type.value()) : zone,
        .celsius = static_cast<double>(millidegrees) / 1000.0});
  }

  if (zones > 0 && reading.sensors.empty()) {
    return collection_failure<TemperatureReading>("no readable thermal zone under " +
                                                  thermal.string());
  }
  std::sort(reading.sensors.begin(), reading.sensors.end(),
            [](const TemperatureSensor &a, const TemperatureSensor &b) { return a.name < b.name; });
  return common::Result<TemperatureReading>::success(std::move(reading));
}

} // namespace hostwarden::metrics
