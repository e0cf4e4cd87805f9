#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hostwarden::config {

struct LoggingConfig {
  std::string level = "info";
  std::string backend = "stderr,file";
  std::string file = "~/.hostwarden/logs/hostwarden.log";
};

struct ThresholdConfig {
  double cpu_percent = 90.0;
  double memory_percent = 90.0;
  double swap_percent = 75.0;
  double disk_percent = 85.0;
  double load_per_core = 1.5;
  std::uint32_t zombie_count = 10;
  double temperature_celsius = 80.0;
};

struct ChecksConfig {
  bool cpu = true;
  bool memory = true;
  bool disk = true;
  bool processes = true;
  bool temperature = false;
};

struct DiskConfig {
  std::string filesystem = "/";
};

struct NetworkConfig {
  bool enabled = true;
  std::string host = "1.1.1.1";
  std::uint32_t timeout_secs = 5;
};

struct ServiceConfig {
  bool enabled = true;
  std::string process_name = "ollama";
  std::string service_name = "ollama.service";
  std::string expected_state = "active";
};

struct PortConfig {
  bool enabled = true;
  std::uint16_t port = 11434;
  std::string expected_state = "listening";
  std::string expected_listen_ip = "127.0.0.1";
};

struct SmtpConfig {
  std::string host = "localhost";
  std::uint16_t port = 587;
  std::string username;
  std::string password;
  std::string sender = "hostwarden@localhost";
  bool tls = true;
};

struct WebhookConfig {
  std::string url;
  std::string secret;
};

struct AlertsConfig {
  bool enabled = true;
  std::string backend = "mail";
  std::string recipient;
  std::string subject_prefix = "[hostwarden]";
  std::uint32_t cooldown_secs = 3600;
  std::uint32_t timeout_secs = 30;
  bool notify_collection_errors = false;
  SmtpConfig smtp;
  WebhookConfig webhook;
};

struct CpuHealConfig {
  bool enabled = false;
  double threshold_percent = 95.0;
  std::uint32_t min_process_age_secs = 10;
};

struct MemoryHealConfig {
  bool enabled = true;
};

struct DiskHealConfig {
  bool enabled = true;
  std::string log_path = "/var/log";
  std::uint32_t log_max_age_days = 30;
  std::string tmp_path = "/tmp";
  std::uint32_t tmp_max_age_days = 7;
};

struct ServiceHealConfig {
  bool enabled = true;
  // Empty means the monitored service.service_name.
  std::string service_name;
};

struct NetworkHealConfig {
  bool enabled = false;
  std::vector<std::string> service_names = {"networking", "NetworkManager", "systemd-networkd"};
};

struct SelfHealConfig {
  bool enabled = false;
  std::vector<std::string> command_prefix;
  std::uint32_t action_timeout_secs = 60;
  std::uint32_t settle_delay_secs = 5;
  std::vector<std::string> excluded_processes = {
      "systemd",    "kthreadd", "sshd",        "rsyslogd", "systemd-journald",
      "dbus-daemon", "login",   "agetty",      "containerd", "dockerd",
      "kubelet",    "supervisord", "hostwarden", "init",     "ollama",
      "python"};
  std::vector<std::string> excluded_users = {"root"};
  std::vector<std::int64_t> excluded_pids;
  std::vector<std::string> excluded_services = {"sshd.service", "ssh.service",
                                                "systemd-journald.service"};
  std::vector<std::string> protected_paths = {"/", "/bin", "/boot", "/dev", "/etc", "/home",
                                              "/lib", "/lib64", "/proc", "/root", "/sbin",
                                              "/sys", "/usr", "/var"};
  bool allow_root = false;
  std::uint32_t max_age_limit_days = 3650;
  CpuHealConfig cpu;
  MemoryHealConfig memory;
  DiskHealConfig disk;
  ServiceHealConfig service;
  NetworkHealConfig network;
};

struct MaintenanceConfig {
  bool mandb_enabled = false;
  std::uint32_t min_interval_hours = 6;
  double cpu_permit_percent = 50.0;
};

struct StateConfig {
  std::string dir = "~/.hostwarden";
};

struct Config {
  std::uint32_t monitor_interval_secs = 60;
  LoggingConfig logging;
  ThresholdConfig thresholds;
  ChecksConfig checks;
  DiskConfig disk;
  NetworkConfig network;
  ServiceConfig service;
  PortConfig port;
  AlertsConfig alerts;
  SelfHealConfig self_heal;
  MaintenanceConfig maintenance;
  StateConfig state;

  std::vector<std::string> load_warnings;
};

} // namespace hostwarden::config
