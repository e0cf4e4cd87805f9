#include "test_framework.hpp"

#include "hostwarden/diagnostics/engine.hpp"

namespace {

namespace dx = hostwarden::diagnostics;
namespace metrics = hostwarden::metrics;
namespace common = hostwarden::common;

dx::DiagnosticPolicy default_policy() {
  dx::DiagnosticPolicy policy;
  policy.network_host = "1.1.1.1";
  policy.process_name = "ollama";
  policy.service_name = "ollama.service";
  policy.port = 11434;
  return policy;
}

metrics::MetricSnapshot cpu_snapshot(double percent, double load = 0.5, unsigned cores = 4) {
  metrics::MetricSnapshot snapshot;
  snapshot.cpu = common::Result<metrics::CpuReading>::success(
      metrics::CpuReading{.percent = percent, .load_1m = load, .cores = cores});
  return snapshot;
}

metrics::MetricSnapshot port_snapshot(bool listening, std::vector<std::string> addresses) {
  metrics::MetricSnapshot snapshot;
  snapshot.port = common::Result<metrics::PortReading>::success(metrics::PortReading{
      .port = 11434, .listening = listening, .addresses = std::move(addresses)});
  return snapshot;
}

metrics::MetricSnapshot service_snapshot(bool running, metrics::ServiceState state) {
  metrics::MetricSnapshot snapshot;
  snapshot.service = common::Result<metrics::ServiceReading>::success(
      metrics::ServiceReading{.process_name = "ollama",
                              .service_name = "ollama.service",
                              .process_running = running,
                              .state = state});
  return snapshot;
}

} // namespace

void register_diagnostics_tests(std::vector<hostwarden::tests::TestCase> &tests) {
  using hostwarden::tests::require;

  tests.push_back({"diagnostics_absent_readings_produce_no_subsystems", [] {
                     const auto result = dx::diagnose(metrics::MetricSnapshot{}, default_policy());
                     require(result.subsystems.empty(), "disabled checks produced entries");
                     require(result.overall == dx::HealthStatus::Nominal, "empty result not nominal");
                   }});

  tests.push_back({"diagnostics_cpu_at_threshold_is_nominal", [] {
                     const auto result = dx::diagnose(cpu_snapshot(90.0), default_policy());
                     const auto *cpu = result.find(dx::Subsystem::Cpu);
                     require(cpu != nullptr, "cpu missing");
                     require(cpu->status == dx::HealthStatus::Nominal,
                             "threshold is exclusive; equal must be nominal");
                     require(cpu->findings.empty(), "finding at threshold");
                     require(!cpu->heal_eligible, "nominal cpu heal eligible");
                   }});

  tests.push_back({"diagnostics_cpu_above_threshold_warns_with_offenders", [] {
                     auto snapshot = cpu_snapshot(97.3);
                     snapshot.processes = common::Result<metrics::ProcessTableReading>::success(
                         metrics::ProcessTableReading{
                             .total = 3,
                             .zombies = 0,
                             .top_cpu = {{.pid = 100, .name = "miner", .cpu_percent = 96.0},
                                         {.pid = 101, .name = "idle", .cpu_percent = 1.0}}});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     const auto *cpu = result.find(dx::Subsystem::Cpu);
                     require(cpu != nullptr, "cpu missing");
                     require(cpu->status == dx::HealthStatus::Warning, "cpu should warn");
                     require(cpu->has_finding(dx::keys::kCpuHigh), "CPU_HIGH missing");
                     require(cpu->heal_eligible, "cpu should be heal eligible");
                     require(cpu->offenders.size() == 1 && cpu->offenders[0].pid == 100,
                             "offenders should be processes above the threshold");
                     require(cpu->observed_value == 97.3, "observed value mismatch");
                     require(cpu->findings[0].summary.find("97.3%") != std::string::npos,
                             "summary should carry the reading");
                     require(result.overall == dx::HealthStatus::Warning, "overall mismatch");
                   }});

  tests.push_back({"diagnostics_load_is_scaled_by_cores", [] {
                     const auto fine = dx::diagnose(cpu_snapshot(10.0, 5.9, 4), default_policy());
                     require(fine.overall == dx::HealthStatus::Nominal, "load 5.9 on 4 cores flagged");
                     const auto busy = dx::diagnose(cpu_snapshot(10.0, 6.5, 4), default_policy());
                     const auto *cpu = busy.find(dx::Subsystem::Cpu);
                     require(cpu->has_finding(dx::keys::kLoadHigh), "LOAD_HIGH missing");
                     require(!cpu->heal_eligible, "load alone must not trigger remediation");
                   }});

  tests.push_back({"diagnostics_failed_reading_is_error_not_threshold", [] {
                     metrics::MetricSnapshot snapshot;
                     snapshot.memory = common::Result<metrics::MemoryReading>::failure(
                         "meminfo unreadable", common::ErrorKind::Collection);
                     snapshot.disk = common::Result<metrics::DiskReading>::success(
                         metrics::DiskReading{.filesystem = "/", .percent = 10.0});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     const auto *memory = result.find(dx::Subsystem::Memory);
                     require(memory != nullptr, "memory missing");
                     require(memory->status == dx::HealthStatus::Error, "memory should be ERROR");
                     require(memory->findings.size() == 1 &&
                                 memory->findings[0].alert_key == "COLLECTION_ERROR_MEMORY",
                             "collection error key mismatch");
                     require(!memory->heal_eligible, "failed reading heal eligible");
                     require(!memory->has_finding(dx::keys::kMemHigh), "threshold finding on error");
                     require(result.find(dx::Subsystem::Disk)->status == dx::HealthStatus::Nominal,
                             "disk affected by memory failure");
                     require(result.overall == dx::HealthStatus::Error, "overall should be ERROR");
                   }});

  tests.push_back({"diagnostics_memory_and_swap_findings", [] {
                     metrics::MetricSnapshot snapshot;
                     snapshot.memory = common::Result<metrics::MemoryReading>::success(
                         metrics::MemoryReading{.percent = 95.0, .used_mb = 7600, .total_mb = 8000,
                                                .swap_percent = 80.0});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     const auto *memory = result.find(dx::Subsystem::Memory);
                     require(memory->has_finding(dx::keys::kMemHigh), "MEM_HIGH missing");
                     require(memory->has_finding(dx::keys::kSwapHigh), "SWAP_HIGH missing");
                     require(memory->heal_eligible, "memory should be eligible");
                   }});

  tests.push_back({"diagnostics_disk_key_names_the_filesystem", [] {
                     metrics::MetricSnapshot snapshot;
                     snapshot.disk = common::Result<metrics::DiskReading>::success(
                         metrics::DiskReading{.filesystem = "/data", .percent = 91.0});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     const auto *disk = result.find(dx::Subsystem::Disk);
                     require(disk->has_finding("DISK_HIGH_/data"), "disk key mismatch");
                     require(disk->heal_eligible, "disk should be eligible");
                   }});

  tests.push_back({"diagnostics_network_down", [] {
                     metrics::MetricSnapshot snapshot;
                     snapshot.network = common::Result<metrics::NetworkReading>::success(
                         metrics::NetworkReading{.host = "1.1.1.1", .reachable = false});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     require(result.find(dx::Subsystem::Network)->has_finding(dx::keys::kNetDown),
                             "NET_DOWN missing");
                   }});

  tests.push_back({"diagnostics_service_expected_active", [] {
                     const auto policy = default_policy();
                     const auto ok = dx::diagnose(
                         service_snapshot(true, metrics::ServiceState::Active), policy);
                     require(ok.overall == dx::HealthStatus::Nominal, "healthy service flagged");

                     const auto stopped = dx::diagnose(
                         service_snapshot(false, metrics::ServiceState::Inactive), policy);
                     const auto *service = stopped.find(dx::Subsystem::Service);
                     require(service->has_finding("PROC_SVC_STATE_ollama.service"),
                             "service key mismatch");
                     require(service->heal_eligible, "stopped service should be eligible");

                     const auto half = dx::diagnose(
                         service_snapshot(false, metrics::ServiceState::Active), policy);
                     require(half.overall == dx::HealthStatus::Warning,
                             "active unit without process should warn");
                   }});

  tests.push_back({"diagnostics_service_expected_inactive_is_never_healed", [] {
                     auto policy = default_policy();
                     policy.service_expected_active = false;
                     const auto running = dx::diagnose(
                         service_snapshot(true, metrics::ServiceState::Active), policy);
                     const auto *service = running.find(dx::Subsystem::Service);
                     require(service->status == dx::HealthStatus::Warning, "should warn");
                     require(!service->heal_eligible, "stopping a service is not a remediation");
                     const auto stopped = dx::diagnose(
                         service_snapshot(false, metrics::ServiceState::Inactive), policy);
                     require(stopped.overall == dx::HealthStatus::Nominal, "expected state flagged");
                   }});

  tests.push_back({"diagnostics_port_states", [] {
                     const auto policy = default_policy();
                     require(dx::diagnose(port_snapshot(true, {"127.0.0.1"}), policy).overall ==
                                 dx::HealthStatus::Nominal,
                             "expected binding flagged");

                     const auto wrong = dx::diagnose(port_snapshot(true, {"0.0.0.0"}), policy);
                     require(wrong.find(dx::Subsystem::Port)->has_finding("PORT_WRONG_IP_11434"),
                             "wrong ip missing");

                     const auto mixed =
                         dx::diagnose(port_snapshot(true, {"127.0.0.1", "10.0.0.5"}), policy);
                     require(mixed.find(dx::Subsystem::Port)->has_finding("PORT_WRONG_IP_11434"),
                             "extra binding not flagged");

                     const auto closed = dx::diagnose(port_snapshot(false, {}), policy);
                     require(closed.find(dx::Subsystem::Port)
                                 ->has_finding("PORT_UNEXPECTED_CLEAR_11434"),
                             "closed port missing");
                     require(!closed.find(dx::Subsystem::Port)->heal_eligible,
                             "port findings have no remediation");

                     auto any = default_policy();
                     any.expected_listen_ip = "any";
                     require(dx::diagnose(port_snapshot(true, {"0.0.0.0"}), any).overall ==
                                 dx::HealthStatus::Nominal,
                             "any should accept every address");

                     auto clear = default_policy();
                     clear.port_expected_listening = false;
                     const auto listening = dx::diagnose(port_snapshot(true, {"127.0.0.1"}), clear);
                     require(listening.find(dx::Subsystem::Port)
                                 ->has_finding("PORT_UNEXPECTED_LISTEN_11434"),
                             "unexpected listen missing");
                   }});

  tests.push_back({"diagnostics_zombies_and_temperature", [] {
                     metrics::MetricSnapshot snapshot;
                     snapshot.processes = common::Result<metrics::ProcessTableReading>::success(
                         metrics::ProcessTableReading{.total = 50, .zombies = 11, .top_cpu = {}});
                     snapshot.temperature = common::Result<metrics::TemperatureReading>::success(
                         metrics::TemperatureReading{.sensors = {{.name = "cpu", .celsius = 85.0},
                                                                 {.name = "gpu", .celsius = 60.0}}});
                     const auto result = dx::diagnose(snapshot, default_policy());
                     require(result.find(dx::Subsystem::Processes)->has_finding(dx::keys::kZombiesHigh),
                             "ZOMBIES_HIGH missing");
                     const auto *temp = result.find(dx::Subsystem::Temperature);
                     require(temp->has_finding(dx::keys::kTempHigh), "TEMP_HIGH missing");
                     require(temp->findings[0].detail.find("cpu=85.0C") != std::string::npos,
                             "hot sensor not named");
                     require(temp->findings[0].detail.find("gpu") == std::string::npos,
                             "cool sensor named");
                     require(result.finding_count() == 2, "finding count mismatch");
                   }});

  tests.push_back({"diagnostics_policy_from_config", [] {
                     hostwarden::config::Config config;
                     config.service.expected_state = "inactive";
                     config.port.expected_state = "clear";
                     config.disk.filesystem = "/srv";
                     const auto policy = dx::DiagnosticPolicy::from_config(config);
                     require(!policy.service_expected_active, "service expectation mismatch");
                     require(!policy.port_expected_listening, "port expectation mismatch");
                     require(policy.disk_filesystem == "/srv", "filesystem mismatch");
                     require(dx::keys::collection_error(dx::Subsystem::Cpu) == "COLLECTION_ERROR_CPU",
                             "collection key mismatch");
                   }});
}
