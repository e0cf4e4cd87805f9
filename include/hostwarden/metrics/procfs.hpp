#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hostwarden::metrics::procfs {

struct CpuTimes {
  std::uint64_t idle = 0;
  std::uint64_t total = 0;
};

/// Aggregate "cpu" line of /proc/stat. iowait counts as idle.
[[nodiscard]] std::optional<CpuTimes> parse_cpu_times(const std::string &stat_text);
[[nodiscard]] unsigned count_cpus(const std::string &stat_text);
[[nodiscard]] std::optional<double> busy_percent(const CpuTimes &before, const CpuTimes &after);

[[nodiscard]] std::optional<double> parse_load1(const std::string &loadavg_text);
[[nodiscard]] std::optional<double> parse_uptime(const std::string &uptime_text);

struct MemInfo {
  std::uint64_t total_kb = 0;
  std::uint64_t available_kb = 0;
  std::uint64_t swap_total_kb = 0;
  std::uint64_t swap_free_kb = 0;
};

/// Falls back to MemFree + Buffers + Cached on kernels without MemAvailable.
[[nodiscard]] std::optional<MemInfo> parse_meminfo(const std::string &text);

/// The kernel truncates comm to this many characters.
inline constexpr std::size_t kCommLength = 15;

struct ProcStat {
  int pid = 0;
  std::string comm;
  char state = '?';
  std::uint64_t utime = 0;
  std::uint64_t stime = 0;
  std::uint64_t starttime = 0;
};

[[nodiscard]] std::optional<ProcStat> parse_proc_stat(const std::string &text);
[[nodiscard]] std::optional<unsigned> parse_status_uid(const std::string &text);
[[nodiscard]] std::string decode_cmdline(const std::string &raw);
/// Basename of argv[0]; the untruncated counterpart of comm.
[[nodiscard]] std::string program_name(const std::string &raw_cmdline);

struct ListenSocket {
  std::string address;
  std::uint16_t port = 0;
};

[[nodiscard]] std::vector<ListenSocket> parse_listen_sockets(const std::string &text, bool ipv6);
[[nodiscard]] std::optional<std::string> decode_address(const std::string &hex, bool ipv6);

/// ::1 -> 127.0.0.1, :: -> 0.0.0.0, ::ffff:a.b.c.d -> a.b.c.d.
[[nodiscard]] std::string normalize_listen_address(const std::string &address);

} // namespace hostwarden::metrics::procfs
