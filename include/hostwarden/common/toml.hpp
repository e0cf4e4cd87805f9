#pragma once

#include "hostwarden/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hostwarden::common {

/// Flat view of a TOML file: every key is stored under its dotted section path
/// ("alerts.smtp.host"). Values keep their raw text until a typed getter reads them.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::unordered_map<std::string, std::size_t> lines;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] std::vector<std::int64_t>
  get_int_array(const std::string &key, const std::vector<std::int64_t> &fallback = {}) const;

  [[nodiscard]] Result<std::optional<bool>> read_bool(const std::string &key) const;
  [[nodiscard]] Result<std::optional<std::int64_t>> read_int(const std::string &key) const;
  [[nodiscard]] Result<std::optional<double>> read_double(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace hostwarden::common
