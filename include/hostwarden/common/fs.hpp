#pragma once

#include "hostwarden/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostwarden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Reads a whole file. Files under /proc report size 0, so this never trusts file_size().
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string &name);

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string hostname();

} // namespace hostwarden::common
