#pragma once

#include "hostwarden/common/result.hpp"
#include "hostwarden/common/toml.hpp"
#include "hostwarden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostwarden::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::filesystem::path state_dir(const Config &config);
[[nodiscard]] std::filesystem::path pid_file_path(const Config &config);
[[nodiscard]] std::filesystem::path status_file_path(const Config &config);
[[nodiscard]] std::filesystem::path journal_path(const Config &config);

[[nodiscard]] common::Result<Config> config_from_toml(const common::TomlDocument &doc);

/// Loads the config file (defaults when it does not exist) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);

/// Range and consistency checks. Returns warnings on success; a failure is fatal at startup.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(Config &config);

void apply_env_overrides(Config &config);

} // namespace hostwarden::config
