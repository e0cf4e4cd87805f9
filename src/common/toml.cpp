#include "hostwarden/common/toml.hpp"

#include "hostwarden/common/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace hostwarden::common {

namespace {

bool is_quote(const char ch) { return ch == '"' || ch == '\''; }

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (is_quote(ch) && (i == 0 || line[i - 1] != '\\')) {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  char quote = '\0';

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (is_quote(ch) && (i == 0 || array_value[i - 1] != '\\')) {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
      current.push_back(ch);
      continue;
    }

    if (quote == '\0' && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  bool escaped = false;
  for (const char ch : body) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool array_is_closed(const std::string &value) {
  char quote = '\0';
  int depth = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (is_quote(ch) && (i == 0 || value[i - 1] != '\\')) {
      if (quote == '\0') {
        quote = ch;
      } else if (quote == ch) {
        quote = '\0';
      }
      continue;
    }
    if (quote != '\0') {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth <= 0;
}

std::optional<std::int64_t> parse_int(const std::string &raw) {
  std::string normalized = trim(raw);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (normalized.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> parse_double(const std::string &raw) {
  std::string normalized = trim(raw);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  if (normalized.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (errno != 0 || end == normalized.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string normalized = trim(raw);
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return std::nullopt;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto &[key, value] : values) {
    out.push_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return parse_int(it->second).value_or(fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::int64_t>
TomlDocument::get_int_array(const std::string &key,
                            const std::vector<std::int64_t> &fallback) const {
  const auto strings = get_string_array(key);
  if (!has(key)) {
    return fallback;
  }
  std::vector<std::int64_t> out;
  for (const auto &element : strings) {
    const auto parsed = parse_int(element);
    if (!parsed.has_value()) {
      return fallback;
    }
    out.push_back(*parsed);
  }
  return out;
}

Result<std::optional<bool>> TomlDocument::read_bool(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::optional<bool>>::success(std::nullopt);
  }
  const auto parsed = parse_bool(it->second);
  if (!parsed.has_value()) {
    return Result<std::optional<bool>>::failure(key + " must be true or false",
                                                ErrorKind::Configuration);
  }
  return Result<std::optional<bool>>::success(parsed);
}

Result<std::optional<std::int64_t>> TomlDocument::read_int(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::optional<std::int64_t>>::success(std::nullopt);
  }
  const auto parsed = parse_int(it->second);
  if (!parsed.has_value()) {
    return Result<std::optional<std::int64_t>>::failure(key + " must be an integer, got " +
                                                            trim(it->second),
                                                        ErrorKind::Configuration);
  }
  return Result<std::optional<std::int64_t>>::success(parsed);
}

Result<std::optional<double>> TomlDocument::read_double(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::optional<double>>::success(std::nullopt);
  }
  const auto parsed = parse_double(it->second);
  if (!parsed.has_value()) {
    return Result<std::optional<double>>::failure(key + " must be a number, got " +
                                                      trim(it->second),
                                                  ErrorKind::Configuration);
  }
  return Result<std::optional<double>>::success(parsed);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty() || current_section.front() == '[') {
        return Result<TomlDocument>::failure("Invalid section header at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::Configuration);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Configuration);
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::Configuration);
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value for " + key + " at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Configuration);
    }

    const std::size_t key_line = line_number;
    if (value.front() == '[') {
      while (!array_is_closed(value) && std::getline(stream, line)) {
        ++line_number;
        value += " " + trim(strip_comment(line));
      }
      if (!array_is_closed(value)) {
        return Result<TomlDocument>::failure("Unterminated array for " + key + " at line " +
                                                 std::to_string(key_line),
                                             ErrorKind::Configuration);
      }
      value = trim(value);
      // a trailing comma before the closing bracket is legal TOML
      if (value.size() > 2) {
        const auto close = value.find_last_of(']');
        std::string body = trim(value.substr(1, close - 1));
        if (!body.empty() && body.back() == ',') {
          body.pop_back();
        }
        value = "[" + body + "]";
      }
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key " + full_key + " at line " +
                                               std::to_string(key_line),
                                           ErrorKind::Configuration);
    }
    document.values[full_key] = value;
    document.lines[full_key] = key_line;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace hostwarden::common
