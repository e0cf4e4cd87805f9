#include "hostwarden/config/config.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

#include <unistd.h>

namespace hostwarden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hostwarden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("HOSTWARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

class ConfigReader {
public:
  explicit ConfigReader(const common::TomlDocument &doc) : doc_(doc) {}

  void read(const std::string &key, std::string &out) {
    if (!take(key)) {
      return;
    }
    const std::string raw = common::trim(doc_.values.at(key));
    if (raw.empty() || (raw.front() != '"' && raw.front() != '\'')) {
      fail(key + " must be a string");
      return;
    }
    out = doc_.get_string(key, out);
  }

  void read(const std::string &key, bool &out) {
    if (!take(key)) {
      return;
    }
    const auto parsed = doc_.read_bool(key);
    if (!parsed.ok()) {
      fail(parsed.error());
      return;
    }
    out = parsed.value().value_or(out);
  }

  void read(const std::string &key, double &out) {
    if (!take(key)) {
      return;
    }
    const auto parsed = doc_.read_double(key);
    if (!parsed.ok()) {
      fail(parsed.error());
      return;
    }
    out = parsed.value().value_or(out);
  }

  template <typename Int> void read_uint(const std::string &key, Int &out) {
    if (!take(key)) {
      return;
    }
    const auto parsed = doc_.read_int(key);
    if (!parsed.ok()) {
      fail(parsed.error());
      return;
    }
    const std::int64_t value = parsed.value().value_or(static_cast<std::int64_t>(out));
    if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<Int>::max()) {
      fail(key + " is out of range: " + std::to_string(value));
      return;
    }
    out = static_cast<Int>(value);
  }

  void read(const std::string &key, std::vector<std::string> &out) {
    if (!take(key)) {
      return;
    }
    if (!is_array(key)) {
      fail(key + " must be an array of strings");
      return;
    }
    out = doc_.get_string_array(key, out);
  }

  void read(const std::string &key, std::vector<std::int64_t> &out) {
    if (!take(key)) {
      return;
    }
    if (!is_array(key)) {
      fail(key + " must be an array of integers");
      return;
    }
    const auto before = out;
    out = doc_.get_int_array(key, {});
    if (out.empty() && common::trim(doc_.values.at(key)) != "[]") {
      out = before;
      fail(key + " must be an array of integers");
    }
  }

  [[nodiscard]] std::vector<std::string> unknown_keys() const {
    std::vector<std::string> out;
    for (const auto &key : doc_.keys()) {
      if (!consumed_.contains(key)) {
        out.push_back(key);
      }
    }
    return out;
  }

  [[nodiscard]] const std::optional<std::string> &error() const { return error_; }

private:
  bool take(const std::string &key) {
    if (!doc_.has(key)) {
      return false;
    }
    consumed_.insert(key);
    return true;
  }

  [[nodiscard]] bool is_array(const std::string &key) const {
    const std::string raw = common::trim(doc_.values.at(key));
    return raw.size() >= 2 && raw.front() == '[' && raw.back() == ']';
  }

  void fail(std::string message) {
    if (!error_.has_value()) {
      const auto line = doc_.lines.find(message.substr(0, message.find(' ')));
      if (line != doc_.lines.end()) {
        message += " (line " + std::to_string(line->second) + ")";
      }
      error_ = std::move(message);
    }
  }

  const common::TomlDocument &doc_;
  std::unordered_set<std::string> consumed_;
  std::optional<std::string> error_;
};

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

std::string int_array_to_toml(const std::vector<std::int64_t> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << values[index];
  }
  stream << ']';
  return stream.str();
}

bool percent_in_range(const double value) { return value >= 0.0 && value <= 100.0; }

bool one_of(const std::string &value, std::initializer_list<const char *> allowed) {
  return std::any_of(allowed.begin(), allowed.end(),
                     [&](const char *candidate) { return value == candidate; });
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorKind::Configuration);
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.kind());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.kind());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::filesystem::path state_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.state.dir));
}

std::filesystem::path pid_file_path(const Config &config) {
  return state_dir(config) / "hostwarden.pid";
}

std::filesystem::path status_file_path(const Config &config) {
  return state_dir(config) / "status.json";
}

std::filesystem::path journal_path(const Config &config) {
  return state_dir(config) / "incidents.db";
}

void apply_env_overrides(Config &config) {
  if (const char *level = std::getenv("HOSTWARDEN_LOG_LEVEL"); level != nullptr && *level) {
    config.logging.level = common::to_lower(level);
  }
  if (const char *recipient = std::getenv("HOSTWARDEN_ALERT_RECIPIENT");
      recipient != nullptr && *recipient) {
    config.alerts.recipient = recipient;
  }
  if (const char *password = std::getenv("HOSTWARDEN_SMTP_PASSWORD");
      password != nullptr && *password) {
    config.alerts.smtp.password = password;
  }
  if (const char *secret = std::getenv("HOSTWARDEN_WEBHOOK_SECRET");
      secret != nullptr && *secret) {
    config.alerts.webhook.secret = secret;
  }
}

common::Result<Config> config_from_toml(const common::TomlDocument &doc) {
  Config config;
  ConfigReader r(doc);

  r.read_uint("monitor_interval_secs", config.monitor_interval_secs);

  r.read("logging.level", config.logging.level);
  r.read("logging.backend", config.logging.backend);
  r.read("logging.file", config.logging.file);

  r.read("thresholds.cpu_percent", config.thresholds.cpu_percent);
  r.read("thresholds.memory_percent", config.thresholds.memory_percent);
  r.read("thresholds.swap_percent", config.thresholds.swap_percent);
  r.read("thresholds.disk_percent", config.thresholds.disk_percent);
  r.read("thresholds.load_per_core", config.thresholds.load_per_core);
  r.read_uint("thresholds.zombie_count", config.thresholds.zombie_count);
  r.read("thresholds.temperature_celsius", config.thresholds.temperature_celsius);

  r.read("checks.cpu", config.checks.cpu);
  r.read("checks.memory", config.checks.memory);
  r.read("checks.disk", config.checks.disk);
  r.read("checks.processes", config.checks.processes);
  r.read("checks.temperature", config.checks.temperature);

  r.read("disk.filesystem", config.disk.filesystem);

  r.read("network.enabled", config.network.enabled);
  r.read("network.host", config.network.host);
  r.read_uint("network.timeout_secs", config.network.timeout_secs);

  r.read("service.enabled", config.service.enabled);
  r.read("service.process_name", config.service.process_name);
  r.read("service.service_name", config.service.service_name);
  r.read("service.expected_state", config.service.expected_state);

  r.read("port.enabled", config.port.enabled);
  r.read_uint("port.port", config.port.port);
  r.read("port.expected_state", config.port.expected_state);
  r.read("port.expected_listen_ip", config.port.expected_listen_ip);

  auto &alerts = config.alerts;
  r.read("alerts.enabled", alerts.enabled);
  r.read("alerts.backend", alerts.backend);
  r.read("alerts.recipient", alerts.recipient);
  r.read("alerts.subject_prefix", alerts.subject_prefix);
  r.read_uint("alerts.cooldown_secs", alerts.cooldown_secs);
  r.read_uint("alerts.timeout_secs", alerts.timeout_secs);
  r.read("alerts.notify_collection_errors", alerts.notify_collection_errors);
  r.read("alerts.smtp.host", alerts.smtp.host);
  r.read_uint("alerts.smtp.port", alerts.smtp.port);
  r.read("alerts.smtp.username", alerts.smtp.username);
  r.read("alerts.smtp.password", alerts.smtp.password);
  r.read("alerts.smtp.sender", alerts.smtp.sender);
  r.read("alerts.smtp.tls", alerts.smtp.tls);
  r.read("alerts.webhook.url", alerts.webhook.url);
  r.read("alerts.webhook.secret", alerts.webhook.secret);

  auto &heal = config.self_heal;
  r.read("self_heal.enabled", heal.enabled);
  r.read("self_heal.command_prefix", heal.command_prefix);
  r.read_uint("self_heal.action_timeout_secs", heal.action_timeout_secs);
  r.read_uint("self_heal.settle_delay_secs", heal.settle_delay_secs);
  r.read("self_heal.excluded_processes", heal.excluded_processes);
  r.read("self_heal.excluded_users", heal.excluded_users);
  r.read("self_heal.excluded_pids", heal.excluded_pids);
  r.read("self_heal.excluded_services", heal.excluded_services);
  r.read("self_heal.protected_paths", heal.protected_paths);
  r.read("self_heal.allow_root", heal.allow_root);
  r.read_uint("self_heal.max_age_limit_days", heal.max_age_limit_days);
  r.read("self_heal.cpu.enabled", heal.cpu.enabled);
  r.read("self_heal.cpu.threshold_percent", heal.cpu.threshold_percent);
  r.read_uint("self_heal.cpu.min_process_age_secs", heal.cpu.min_process_age_secs);
  r.read("self_heal.memory.enabled", heal.memory.enabled);
  r.read("self_heal.disk.enabled", heal.disk.enabled);
  r.read("self_heal.disk.log_path", heal.disk.log_path);
  r.read_uint("self_heal.disk.log_max_age_days", heal.disk.log_max_age_days);
  r.read("self_heal.disk.tmp_path", heal.disk.tmp_path);
  r.read_uint("self_heal.disk.tmp_max_age_days", heal.disk.tmp_max_age_days);
  r.read("self_heal.service.enabled", heal.service.enabled);
  r.read("self_heal.service.service_name", heal.service.service_name);
  r.read("self_heal.network.enabled", heal.network.enabled);
  r.read("self_heal.network.service_names", heal.network.service_names);

  r.read("maintenance.mandb_enabled", config.maintenance.mandb_enabled);
  r.read_uint("maintenance.min_interval_hours", config.maintenance.min_interval_hours);
  r.read("maintenance.cpu_permit_percent", config.maintenance.cpu_permit_percent);

  r.read("state.dir", config.state.dir);

  if (r.error().has_value()) {
    return common::Result<Config>::failure(*r.error(), common::ErrorKind::Configuration);
  }

  for (const auto &key : r.unknown_keys()) {
    std::string warning = "unknown config key ignored: " + key;
    if (const auto line = doc.lines.find(key); line != doc.lines.end()) {
      warning += " (line " + std::to_string(line->second) + ")";
    }
    config.load_warnings.push_back(std::move(warning));
  }

  config.logging.file = expand_config_value(config.logging.file);
  config.state.dir = expand_config_value(config.state.dir);
  config.alerts.smtp.password = expand_config_value(config.alerts.smtp.password);
  config.alerts.webhook.secret = expand_config_value(config.alerts.webhook.secret);
  config.alerts.webhook.url = expand_config_value(config.alerts.webhook.url);
  config.logging.level = common::to_lower(common::trim(config.logging.level));
  config.alerts.backend = common::to_lower(common::trim(config.alerts.backend));
  config.service.expected_state = common::to_lower(common::trim(config.service.expected_state));
  config.port.expected_state = common::to_lower(common::trim(config.port.expected_state));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(),
                                           common::ErrorKind::Configuration);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.load_warnings.push_back("config file " + path.string() +
                                   " not found, using defaults");
    config.logging.file = expand_config_value(config.logging.file);
    config.state.dir = expand_config_value(config.state.dir);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorKind::Configuration);
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorKind::Configuration);
  }

  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(),
                                           common::ErrorKind::Configuration);
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  const auto q = [](const std::string &value) { return common::quote_toml_string(value); };

  file << "monitor_interval_secs = " << config.monitor_interval_secs << "\n";

  file << "\n[logging]\n";
  file << "level = " << q(config.logging.level) << "\n";
  file << "backend = " << q(config.logging.backend) << "\n";
  file << "file = " << q(config.logging.file) << "\n";

  const auto &t = config.thresholds;
  file << "\n[thresholds]\n";
  file << "cpu_percent = " << t.cpu_percent << "\n";
  file << "memory_percent = " << t.memory_percent << "\n";
  file << "swap_percent = " << t.swap_percent << "\n";
  file << "disk_percent = " << t.disk_percent << "\n";
  file << "load_per_core = " << t.load_per_core << "\n";
  file << "zombie_count = " << t.zombie_count << "\n";
  file << "temperature_celsius = " << t.temperature_celsius << "\n";

  file << "\n[checks]\n";
  file << "cpu = " << bool_to_toml(config.checks.cpu) << "\n";
  file << "memory = " << bool_to_toml(config.checks.memory) << "\n";
  file << "disk = " << bool_to_toml(config.checks.disk) << "\n";
  file << "processes = " << bool_to_toml(config.checks.processes) << "\n";
  file << "temperature = " << bool_to_toml(config.checks.temperature) << "\n";

  file << "\n[disk]\n";
  file << "filesystem = " << q(config.disk.filesystem) << "\n";

  file << "\n[network]\n";
  file << "enabled = " << bool_to_toml(config.network.enabled) << "\n";
  file << "host = " << q(config.network.host) << "\n";
  file << "timeout_secs = " << config.network.timeout_secs << "\n";

  file << "\n[service]\n";
  file << "enabled = " << bool_to_toml(config.service.enabled) << "\n";
  file << "process_name = " << q(config.service.process_name) << "\n";
  file << "service_name = " << q(config.service.service_name) << "\n";
  file << "expected_state = " << q(config.service.expected_state) << "\n";

  file << "\n[port]\n";
  file << "enabled = " << bool_to_toml(config.port.enabled) << "\n";
  file << "port = " << config.port.port << "\n";
  file << "expected_state = " << q(config.port.expected_state) << "\n";
  file << "expected_listen_ip = " << q(config.port.expected_listen_ip) << "\n";

  const auto &a = config.alerts;
  file << "\n[alerts]\n";
  file << "enabled = " << bool_to_toml(a.enabled) << "\n";
  file << "backend = " << q(a.backend) << "\n";
  file << "recipient = " << q(a.recipient) << "\n";
  file << "subject_prefix = " << q(a.subject_prefix) << "\n";
  file << "cooldown_secs = " << a.cooldown_secs << "\n";
  file << "timeout_secs = " << a.timeout_secs << "\n";
  file << "notify_collection_errors = " << bool_to_toml(a.notify_collection_errors) << "\n";

  file << "\n[alerts.smtp]\n";
  file << "host = " << q(a.smtp.host) << "\n";
  file << "port = " << a.smtp.port << "\n";
  file << "username = " << q(a.smtp.username) << "\n";
  file << "password = " << q(a.smtp.password) << "\n";
  file << "sender = " << q(a.smtp.sender) << "\n";
  file << "tls = " << bool_to_toml(a.smtp.tls) << "\n";

  file << "\n[alerts.webhook]\n";
  file << "url = " << q(a.webhook.url) << "\n";
  file << "secret = " << q(a.webhook.secret) << "\n";

  const auto &h = config.self_heal;
  file << "\n[self_heal]\n";
  file << "enabled = " << bool_to_toml(h.enabled) << "\n";
  file << "command_prefix = " << string_array_to_toml(h.command_prefix) << "\n";
  file << "action_timeout_secs = " << h.action_timeout_secs << "\n";
  file << "settle_delay_secs = " << h.settle_delay_secs << "\n";
  file << "excluded_processes = " << string_array_to_toml(h.excluded_processes) << "\n";
  file << "excluded_users = " << string_array_to_toml(h.excluded_users) << "\n";
  file << "excluded_pids = " << int_array_to_toml(h.excluded_pids) << "\n";
  file << "excluded_services = " << string_array_to_toml(h.excluded_services) << "\n";
  file << "protected_paths = " << string_array_to_toml(h.protected_paths) << "\n";
  file << "allow_root = " << bool_to_toml(h.allow_root) << "\n";
  file << "max_age_limit_days = " << h.max_age_limit_days << "\n";

  file << "\n[self_heal.cpu]\n";
  file << "enabled = " << bool_to_toml(h.cpu.enabled) << "\n";
  file << "threshold_percent = " << h.cpu.threshold_percent << "\n";
  file << "min_process_age_secs = " << h.cpu.min_process_age_secs << "\n";

  file << "\n[self_heal.memory]\n";
  file << "enabled = " << bool_to_toml(h.memory.enabled) << "\n";

  file << "\n[self_heal.disk]\n";
  file << "enabled = " << bool_to_toml(h.disk.enabled) << "\n";
  file << "log_path = " << q(h.disk.log_path) << "\n";
  file << "log_max_age_days = " << h.disk.log_max_age_days << "\n";
  file << "tmp_path = " << q(h.disk.tmp_path) << "\n";
  file << "tmp_max_age_days = " << h.disk.tmp_max_age_days << "\n";

  file << "\n[self_heal.service]\n";
  file << "enabled = " << bool_to_toml(h.service.enabled) << "\n";
  file << "service_name = " << q(h.service.service_name) << "\n";

  file << "\n[self_heal.network]\n";
  file << "enabled = " << bool_to_toml(h.network.enabled) << "\n";
  file << "service_names = " << string_array_to_toml(h.network.service_names) << "\n";

  file << "\n[maintenance]\n";
  file << "mandb_enabled = " << bool_to_toml(config.maintenance.mandb_enabled) << "\n";
  file << "min_interval_hours = " << config.maintenance.min_interval_hours << "\n";
  file << "cpu_permit_percent = " << config.maintenance.cpu_permit_percent << "\n";

  file << "\n[state]\n";
  file << "dir = " << q(config.state.dir) << "\n";
  return file.str();
}

common::Result<std::vector<std::string>> validate_config(Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  const auto fail = [](const std::string &message) {
    return Warnings::failure(message, common::ErrorKind::Configuration);
  };
  std::vector<std::string> warnings = config.load_warnings;

  if (config.monitor_interval_secs < 10) {
    return fail("monitor_interval_secs must be at least 10");
  }
  if (!one_of(config.logging.level, {"debug", "info", "warn", "error"})) {
    return fail("Invalid logging.level: " + config.logging.level);
  }
  for (const auto &backend : common::split(common::to_lower(config.logging.backend), ',')) {
    if (!one_of(backend, {"stderr", "log", "file", "none"})) {
      return fail("Invalid logging.backend entry: " + backend);
    }
  }

  const auto &t = config.thresholds;
  if (!percent_in_range(t.cpu_percent) || !percent_in_range(t.memory_percent) ||
      !percent_in_range(t.swap_percent) || !percent_in_range(t.disk_percent)) {
    return fail("threshold percentages must be between 0 and 100");
  }
  if (t.load_per_core <= 0.0) {
    return fail("thresholds.load_per_core must be > 0");
  }
  if (t.temperature_celsius <= 0.0 || t.temperature_celsius > 150.0) {
    return fail("thresholds.temperature_celsius must be between 1 and 150");
  }

  if (config.checks.disk) {
    if (config.disk.filesystem.empty() || config.disk.filesystem.front() != '/') {
      return fail("disk.filesystem must be an absolute path");
    }
  }

  if (config.network.enabled) {
    if (common::trim(config.network.host).empty()) {
      return fail("network.host is required when network checks are enabled");
    }
    if (config.network.timeout_secs == 0 || config.network.timeout_secs > 60) {
      return fail("network.timeout_secs must be between 1 and 60");
    }
  }

  if (!one_of(config.service.expected_state, {"active", "inactive"})) {
    return fail("service.expected_state must be active or inactive, got " +
                config.service.expected_state);
  }
  if (config.service.enabled && (common::trim(config.service.process_name).empty() ||
                                 common::trim(config.service.service_name).empty())) {
    return fail("service.process_name and service.service_name are required");
  }

  if (!one_of(config.port.expected_state, {"listening", "clear"})) {
    return fail("port.expected_state must be listening or clear, got " +
                config.port.expected_state);
  }
  if (config.port.enabled) {
    if (config.port.port == 0) {
      return fail("port.port must be 1-65535");
    }
    if (common::trim(config.port.expected_listen_ip).empty()) {
      return fail("port.expected_listen_ip is required (use \"any\" to accept every address)");
    }
  }

  auto &a = config.alerts;
  if (!one_of(a.backend, {"smtp", "webhook", "mail", "log", "none"})) {
    return fail("Invalid alerts.backend: " + a.backend);
  }
  if (a.timeout_secs == 0) {
    return fail("alerts.timeout_secs must be > 0");
  }
  if (a.enabled) {
    if ((a.backend == "smtp" || a.backend == "mail") && common::trim(a.recipient).empty()) {
      warnings.push_back("alerts.recipient is empty; email alerts disabled");
      a.enabled = false;
    } else if (a.backend == "webhook" && common::trim(a.webhook.url).empty()) {
      warnings.push_back("alerts.webhook.url is empty; webhook alerts disabled");
      a.enabled = false;
    } else if (a.backend == "smtp") {
      if (common::trim(a.smtp.host).empty()) {
        return fail("alerts.smtp.host is required for the smtp backend");
      }
      if (a.smtp.port == 0) {
        return fail("alerts.smtp.port must be 1-65535");
      }
    } else if (a.backend == "none") {
      warnings.push_back("alerts.backend is none; alerts are logged only as suppressed");
    }
  }

  auto &h = config.self_heal;
  if (h.action_timeout_secs == 0 || h.action_timeout_secs > 3600) {
    return fail("self_heal.action_timeout_secs must be between 1 and 3600");
  }
  if (h.settle_delay_secs > 300) {
    return fail("self_heal.settle_delay_secs must be at most 300");
  }
  if (h.max_age_limit_days == 0) {
    return fail("self_heal.max_age_limit_days must be > 0");
  }
  if (!percent_in_range(h.cpu.threshold_percent)) {
    return fail("self_heal.cpu.threshold_percent must be between 0 and 100");
  }
  if (h.enabled) {
    if (h.disk.enabled) {
      if (common::trim(h.disk.log_path).empty() && common::trim(h.disk.tmp_path).empty()) {
        warnings.push_back("self_heal.disk is enabled without cleanup paths; it will refuse");
      }
      for (const auto days : {h.disk.log_max_age_days, h.disk.tmp_max_age_days}) {
        if (days == 0 || days > h.max_age_limit_days) {
          warnings.push_back("self_heal.disk max age " + std::to_string(days) +
                             " is outside [1, " + std::to_string(h.max_age_limit_days) +
                             "]; cleanup will refuse");
          break;
        }
      }
    }
    if (h.cpu.enabled && h.cpu.threshold_percent < t.cpu_percent) {
      warnings.push_back("self_heal.cpu.threshold_percent is below thresholds.cpu_percent");
    }
    if (h.network.enabled && h.network.service_names.empty()) {
      warnings.push_back("self_heal.network is enabled without service_names");
    }
    if (h.command_prefix.empty() && geteuid() != 0) {
      warnings.push_back("self_heal.command_prefix is empty and the agent is not root; "
                         "privileged actions will likely fail");
    }
  }

  if (config.maintenance.min_interval_hours == 0) {
    return fail("maintenance.min_interval_hours must be > 0");
  }
  if (!percent_in_range(config.maintenance.cpu_permit_percent)) {
    return fail("maintenance.cpu_permit_percent must be between 0 and 100");
  }

  if (common::trim(config.state.dir).empty()) {
    return fail("state.dir is required");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace hostwarden::config
