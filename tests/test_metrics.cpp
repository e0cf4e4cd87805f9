#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "hostwarden/metrics/proc_source.hpp"
#include "hostwarden/metrics/procfs.hpp"

#include <algorithm>
#include <cmath>

namespace {

std::string stat_line(int pid, const std::string &comm, char state, std::uint64_t utime,
                      std::uint64_t stime, std::uint64_t starttime) {
  return std::to_string(pid) + " (" + comm + ") " + state +
         " 1 " + std::to_string(pid) + " " + std::to_string(pid) + " 0 -1 4194304 100 0 0 0 " +
         std::to_string(utime) + " " + std::to_string(stime) + " 0 0 20 0 1 0 " +
         std::to_string(starttime) + " 1000000 200 18446744073709551615\n";
}

constexpr const char *kTcpHeader =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  "
    "timeout inode\n";

bool near(double a, double b) { return std::fabs(a - b) < 0.01; }

} // namespace

void register_metrics_tests(std::vector<hostwarden::tests::TestCase> &tests) {
  using hostwarden::tests::require;
  namespace metrics = hostwarden::metrics;
  namespace procfs = hostwarden::metrics::procfs;
  namespace ht = hostwarden::testing;

  tests.push_back({"procfs_cpu_times_count_iowait_as_idle", [] {
                     const std::string stat = "cpu  100 0 50 800 50 0 0 0\n"
                                              "cpu0 50 0 25 400 25 0 0 0\n"
                                              "cpu1 50 0 25 400 25 0 0 0\n"
                                              "intr 12345\n";
                     const auto times = procfs::parse_cpu_times(stat);
                     require(times.has_value(), "cpu line not parsed");
                     require(times->idle == 850, "iowait not counted as idle");
                     require(times->total == 1000, "total mismatch");
                     require(procfs::count_cpus(stat) == 2, "core count mismatch");
                     require(!procfs::parse_cpu_times("intr 1\n").has_value(),
                             "missing cpu line accepted");
                   }});

  tests.push_back({"procfs_busy_percent_from_deltas", [] {
                     const procfs::CpuTimes before{.idle = 800, .total = 1000};
                     const procfs::CpuTimes after{.idle = 850, .total = 1200};
                     const auto busy = procfs::busy_percent(before, after);
                     require(busy.has_value() && near(*busy, 75.0), "busy percent mismatch");
                     require(!procfs::busy_percent(before, before).has_value(),
                             "zero delta should be unknown");
                   }});

  tests.push_back({"procfs_meminfo_prefers_available", [] {
                     const auto info = procfs::parse_meminfo("MemTotal: 1000 kB\n"
                                                             "MemFree: 100 kB\n"
                                                             "MemAvailable: 400 kB\n"
                                                             "SwapTotal: 200 kB\n"
                                                             "SwapFree: 50 kB\n");
                     require(info.has_value(), "meminfo not parsed");
                     require(info->available_kb == 400, "available mismatch");
                     require(info->swap_total_kb == 200 && info->swap_free_kb == 50,
                             "swap mismatch");

                     const auto legacy = procfs::parse_meminfo(
                         "MemTotal: 1000 kB\nMemFree: 100 kB\nBuffers: 50 kB\nCached: 150 kB\n");
                     require(legacy.has_value() && legacy->available_kb == 300,
                             "legacy available fallback mismatch");
                     require(!procfs::parse_meminfo("MemFree: 1 kB\n").has_value(),
                             "missing MemTotal accepted");
                   }});

  tests.push_back({"procfs_proc_stat_handles_parentheses_in_comm", [] {
                     const auto stat = procfs::parse_proc_stat(stat_line(77, "a) (b", 'R', 300, 20, 999));
                     require(stat.has_value(), "stat not parsed");
                     require(stat->pid == 77, "pid mismatch");
                     require(stat->comm == "a) (b", "comm mismatch");
                     require(stat->state == 'R', "state mismatch");
                     require(stat->utime == 300 && stat->stime == 20, "times mismatch");
                     require(stat->starttime == 999, "starttime mismatch");
                     require(!procfs::parse_proc_stat("12 (short) S 1 2").has_value(),
                             "truncated stat accepted");
                   }});

  tests.push_back({"procfs_status_uid_and_cmdline", [] {
                     const auto uid = procfs::parse_status_uid("Name:\tx\nUid:\t1000\t1000\t1000\t1000\n");
                     require(uid.has_value() && *uid == 1000, "uid mismatch");
                     const std::string raw("python3\0-m\0http.server\0", 24);
                     require(procfs::decode_cmdline(raw) == "python3 -m http.server",
                             "cmdline decode mismatch");
                     require(procfs::program_name(std::string("/usr/sbin/cron\0-f\0", 18)) == "cron",
                             "program name should be the argv[0] basename");
                     require(procfs::program_name("").empty(), "empty cmdline");
                   }});

  tests.push_back({"procfs_listen_sockets_decode_and_normalize", [] {
                     const std::string tcp = std::string(kTcpHeader) +
                                             "   0: 0100007F:2CAA 00000000:0000 0A 00000000:00000000 "
                                             "00:00000000 00000000  1000        0 1 1 0\n"
                                             "   1: 0100007F:1F90 0200007F:C350 01 00000000:00000000 "
                                             "00:00000000 00000000  1000        0 2 1 0\n";
                     const auto sockets = procfs::parse_listen_sockets(tcp, false);
                     require(sockets.size() == 1, "only LISTEN rows should be kept");
                     require(sockets[0].address == "127.0.0.1", "ipv4 address mismatch");
                     require(sockets[0].port == 11434, "port mismatch");

                     const std::string tcp6 = std::string(kTcpHeader) +
                                              "   0: 00000000000000000000000001000000:2CAA "
                                              "00000000000000000000000000000000:0000 0A 0:0 0:0 0 "
                                              "1000 0 3 1 0\n";
                     const auto v6 = procfs::parse_listen_sockets(tcp6, true);
                     require(v6.size() == 1 && v6[0].address == "::1", "ipv6 loopback mismatch");
                     require(procfs::normalize_listen_address("::1") == "127.0.0.1",
                             "::1 not normalized");
                     require(procfs::normalize_listen_address("::") == "0.0.0.0",
                             ":: not normalized");
                     require(procfs::normalize_listen_address("::ffff:10.0.0.5") == "10.0.0.5",
                             "mapped address not normalized");
                   }});

  tests.push_back({"proc_source_reads_memory_from_proc_root", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/meminfo", "MemTotal: 8192000 kB\n"
                                                           "MemAvailable: 2048000 kB\n"
                                                           "SwapTotal: 1000 kB\n"
                                                           "SwapFree: 250 kB\n");
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc"});
                     const auto memory = source.read_memory();
                     require(memory.ok(), memory.error());
                     require(near(memory.value().percent, 75.0), "memory percent mismatch");
                     require(memory.value().total_mb == 8000, "total mb mismatch");
                     require(near(memory.value().swap_percent, 75.0), "swap percent mismatch");
                   }});

  tests.push_back({"proc_source_missing_files_are_collection_errors", [] {
                     ht::TempWorkspace workspace;
                     metrics::ProcMetricSource source(metrics::ProcfsOptions{
                         .proc_root = workspace.path() / "nothing",
                         .sample_window = std::chrono::milliseconds(0)});
                     const auto cpu = source.read_cpu();
                     require(!cpu.ok(), "cpu without /proc/stat succeeded");
                     require(cpu.kind() == hostwarden::common::ErrorKind::Collection,
                             "wrong error kind");
                     require(!source.read_memory().ok(), "memory without meminfo succeeded");
                     require(!source.port_state(22).ok(), "port without net/tcp succeeded");
                   }});

  tests.push_back({"proc_source_static_stat_is_not_a_cpu_reading", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/stat", "cpu  100 0 50 800 50 0 0 0\n");
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc",
                                                .sample_window = std::chrono::milliseconds(0)});
                     require(!source.read_cpu().ok(), "unchanged counters produced a reading");
                   }});

  tests.push_back({"proc_source_port_state_merges_families", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/net/tcp",
                                           std::string(kTcpHeader) +
                                               "   0: 0100007F:2CAA 00000000:0000 0A 0:0 0:0 0 0 0 "
                                               "1 1 0\n");
                     workspace.create_file("proc/net/tcp6",
                                           std::string(kTcpHeader) +
                                               "   0: 00000000000000000000000001000000:2CAA "
                                               "00000000000000000000000000000000:0000 0A 0:0 0:0 0 "
                                               "0 0 2 1 0\n"
                                               "   1: 00000000000000000000000000000000:0016 "
                                               "00000000000000000000000000000000:0000 0A 0:0 0:0 0 "
                                               "0 0 3 1 0\n");
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc"});
                     const auto port = source.port_state(11434);
                     require(port.ok(), port.error());
                     require(port.value().listening, "port should be listening");
                     require(port.value().addresses.size() == 1,
                             "::1 and 127.0.0.1 should collapse");
                     require(port.value().bound_ip() == "127.0.0.1", "bound ip mismatch");

                     const auto ssh = source.port_state(22);
                     require(ssh.ok() && ssh.value().bound_ip() == "0.0.0.0", "wildcard mismatch");
                     const auto closed = source.port_state(8080);
                     require(closed.ok() && !closed.value().listening, "closed port listening");
                   }});

  tests.push_back({"proc_source_process_table_counts_zombies", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/uptime", "1000.00 4000.00\n");
                     workspace.create_file("proc/4001/stat", stat_line(4001, "worker", 'R', 10, 5, 100));
                     workspace.create_file("proc/4001/status", "Name:\tworker\nUid:\t0\t0\t0\t0\n");
                     workspace.create_file("proc/4002/stat", stat_line(4002, "defunct", 'Z', 0, 0, 50));
                     workspace.create_file("proc/4003/stat", stat_line(4003, "idle", 'S', 1, 1, 200));
                     workspace.create_file("proc/self-test/stat", "not a pid dir");
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc",
                                                .sample_window = std::chrono::milliseconds(10)});
                     const auto table = source.read_processes(1);
                     require(table.ok(), table.error());
                     require(table.value().total == 3, "total mismatch");
                     require(table.value().zombies == 1, "zombie count mismatch");
                     require(table.value().top_cpu.size() == 1, "top_n not applied");
                     const auto &top = table.value().top_cpu.front();
                     require(top.pid == 4001 || top.pid == 4003, "zombie listed as consumer");
                     require(top.age_seconds >= 0.0, "negative age");
                   }});

  tests.push_back({"proc_source_recovers_names_truncated_by_comm", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/uptime", "1000.00 4000.00\n");
                     workspace.create_file("proc/4101/stat",
                                           stat_line(4101, "my-important-da", 'R', 10, 5, 100));
                     workspace.create_file("proc/4101/status", "Name:\tx\nUid:\t1000\t1000\t1000\t1000\n");
                     workspace.create_file("proc/4101/cmdline",
                                           std::string("/tmp/my-important-daemon\0--serve\0", 33));
                     workspace.create_file("proc/4102/stat",
                                           stat_line(4102, "another-long-na", 'R', 10, 5, 100));
                     workspace.create_file("proc/4102/cmdline", std::string("/usr/bin/unrelated\0", 19));
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc",
                                                .sample_window = std::chrono::milliseconds(10)});
                     const auto table = source.read_processes(5);
                     require(table.ok(), table.error());
                     const auto &top = table.value().top_cpu;
                     const auto find = [&top](int pid) {
                       return std::find_if(top.begin(), top.end(),
                                           [pid](const metrics::ProcessSample &s) { return s.pid == pid; });
                     };
                     require(find(4101) != top.end() && find(4101)->name == "my-important-daemon",
                             "full program name not recovered");
                     require(find(4102) != top.end() && find(4102)->name == "another-long-na",
                             "unrelated argv[0] should not replace comm");
                   }});

  tests.push_back({"proc_source_process_present_matches_comm_and_cmdline", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("proc/5001/comm", "ollama\n");
                     workspace.create_file("proc/5002/comm", "python3\n");
                     workspace.create_file("proc/5002/cmdline",
                                           std::string("python3\0/opt/app/server.py\0", 27));
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.proc_root = workspace.path() / "proc"});
                     const auto by_comm = source.process_present("ollama");
                     require(by_comm.ok() && by_comm.value(), "comm match failed");
                     const auto by_cmdline = source.process_present("server.py");
                     require(by_cmdline.ok() && by_cmdline.value(), "cmdline match failed");
                     const auto absent = source.process_present("nginx");
                     require(absent.ok() && !absent.value(), "absent process found");
                   }});

  tests.push_back({"proc_source_temperatures_from_thermal_zones", [] {
                     ht::TempWorkspace workspace;
                     workspace.create_file("sys/class/thermal/thermal_zone0/temp", "45000\n");
                     workspace.create_file("sys/class/thermal/thermal_zone0/type", "x86_pkg_temp\n");
                     workspace.create_file("sys/class/thermal/thermal_zone1/temp", "81500\n");
                     workspace.create_file("sys/class/thermal/cooling_device0/type", "fan\n");
                     metrics::ProcMetricSource source(
                         metrics::ProcfsOptions{.sys_root = workspace.path() / "sys"});
                     const auto reading = source.read_temperatures();
                     require(reading.ok(), reading.error());
                     const auto &sensors = reading.value().sensors;
                     require(sensors.size() == 2, "sensor count mismatch");
                     const auto hot = std::find_if(sensors.begin(), sensors.end(), [](const auto &s) {
                       return s.name == "thermal_zone1";
                     });
                     require(hot != sensors.end() && near(hot->celsius, 81.5),
                             "zone without type should use its directory name");

                     metrics::ProcMetricSource bare(
                         metrics::ProcfsOptions{.sys_root = workspace.path() / "none"});
                     const auto none = bare.read_temperatures();
                     require(none.ok() && none.value().sensors.empty(),
                             "missing thermal class should mean no sensors");
                   }});

  tests.push_back({"proc_source_reads_root_filesystem", [] {
                     metrics::ProcMetricSource source;
                     const auto disk = source.read_disk("/");
                     require(disk.ok(), disk.error());
                     require(disk.value().percent >= 0.0 && disk.value().percent <= 100.0,
                             "disk percent out of range");
                     require(!source.read_disk("/hostwarden/does/not/exist").ok(),
                             "missing filesystem succeeded");
                   }});
}
