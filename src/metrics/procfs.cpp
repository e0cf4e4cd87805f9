#include "hostwarden/metrics/procfs.hpp"

#include "hostwarden/common/fs.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace hostwarden::metrics::procfs {

namespace {

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_leading_double(const std::string &text) {
  std::istringstream stream(text);
  double value = 0.0;
  if (!(stream >> value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::uint32_t> parse_hex32(const std::string &hex) {
  std::uint32_t value = 0;
  const auto *first = hex.data();
  const auto *last = first + hex.size();
  auto [ptr, ec] = std::from_chars(first, last, value, 16);
  if (hex.size() != 8 || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<CpuTimes> parse_cpu_times(const std::string &stat_text) {
  std::istringstream lines(stat_text);
  std::string line;
  while (std::getline(lines, line)) {
    if (!common::starts_with(line, "cpu ")) {
      continue;
    }
    std::istringstream fields(line.substr(4));
    std::uint64_t values[8] = {0};
    int count = 0;
    while (count < 8 && (fields >> values[count])) {
      ++count;
    }
    if (count < 4) {
      return std::nullopt;
    }
    CpuTimes times;
    // user nice system idle iowait irq softirq steal
    times.idle = values[3] + (count > 4 ? values[4] : 0);
    for (int i = 0; i < count; ++i) {
      times.total += values[i];
    }
    return times;
  }
  return std::nullopt;
}

unsigned count_cpus(const std::string &stat_text) {
  std::istringstream lines(stat_text);
  std::string line;
  unsigned count = 0;
  while (std::getline(lines, line)) {
    if (line.size() > 3 && common::starts_with(line, "cpu") &&
        std::isdigit(static_cast<unsigned char>(line[3])) != 0) {
      ++count;
    }
  }
  return count == 0 ? 1 : count;
}

std::optional<double> busy_percent(const CpuTimes &before, const CpuTimes &after) {
  if (after.total <= before.total || after.idle < before.idle) {
    return std::nullopt;
  }
  const double total = static_cast<double>(after.total - before.total);
  const double idle = static_cast<double>(after.idle - before.idle);
  double busy = (1.0 - idle / total) * 100.0;
  if (busy < 0.0) {
    busy = 0.0;
  }
  return busy > 100.0 ? 100.0 : busy;
}

std::optional<double> parse_load1(const std::string &loadavg_text) {
  return parse_leading_double(loadavg_text);
}

std::optional<double> parse_uptime(const std::string &uptime_text) {
  return parse_leading_double(uptime_text);
}

std::optional<MemInfo> parse_meminfo(const std::string &text) {
  std::istringstream lines(text);
  std::string line;
  MemInfo info;
  bool have_total = false;
  bool have_available = false;
  std::uint64_t free_kb = 0;
  std::uint64_t buffers_kb = 0;
  std::uint64_t cached_kb = 0;

  while (std::getline(lines, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = line.substr(0, colon);
    std::istringstream value_stream(line.substr(colon + 1));
    std::uint64_t value = 0;
    if (!(value_stream >> value)) {
      continue;
    }
    if (key == "MemTotal") {
      info.total_kb = value;
      have_total = true;
    } else if (key == "MemAvailable") {
      info.available_kb = value;
      have_available = true;
    } else if (key == "MemFree") {
      free_kb = value;
    } else if (key == "Buffers") {
      buffers_kb = value;
    } else if (key == "Cached") {
      cached_kb = value;
    } else if (key == "SwapTotal") {
      info.swap_total_kb = value;
    } else if (key == "SwapFree") {
      info.swap_free_kb = value;
    }
  }

  if (!have_total || info.total_kb == 0) {
    return std::nullopt;
  }
  if (!have_available) {
    info.available_kb = free_kb + buffers_kb + cached_kb;
  }
  if (info.available_kb > info.total_kb) {
    info.available_kb = info.total_kb;
  }
  return info;
}

std::optional<ProcStat> parse_proc_stat(const std::string &text) {
  // comm may contain spaces and parentheses; it ends at the last ')'.
  const auto lp = text.find('(');
  const auto rp = text.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > text.size()) {
    return std::nullopt;
  }

  ProcStat stat;
  const auto pid = parse_u64(common::trim(text.substr(0, lp)));
  if (!pid.has_value()) {
    return std::nullopt;
  }
  stat.pid = static_cast<int>(*pid);
  stat.comm = text.substr(lp + 1, rp - lp - 1);

  std::istringstream fields(text.substr(rp + 2));
  std::vector<std::string> rest;
  std::string field;
  while (fields >> field) {
    rest.push_back(field);
  }
  // rest[0] is field 3 (state); utime/stime are fields 14/15, starttime is 22.
  if (rest.size() < 20 || rest[0].size() != 1) {
    return std::nullopt;
  }
  stat.state = rest[0][0];
  const auto utime = parse_u64(rest[11]);
  const auto stime = parse_u64(rest[12]);
  const auto start = parse_u64(rest[19]);
  if (!utime.has_value() || !stime.has_value() || !start.has_value()) {
    return std::nullopt;
  }
  stat.utime = *utime;
  stat.stime = *stime;
  stat.starttime = *start;
  return stat;
}

std::optional<unsigned> parse_status_uid(const std::string &text) {
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (!common::starts_with(line, "Uid:")) {
      continue;
    }
    std::istringstream fields(line.substr(4));
    unsigned uid = 0;
    if (fields >> uid) {
      return uid;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

std::string decode_cmdline(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool separator = true;
  for (const char ch : raw) {
    if (ch == '\0') {
      if (!separator) {
        out.push_back(' ');
        separator = true;
      }
      continue;
    }
    out.push_back(ch);
    separator = false;
  }
  if (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

std::string program_name(const std::string &raw_cmdline) {
  const std::string argv0 = raw_cmdline.substr(0, raw_cmdline.find('\0'));
  const auto slash = argv0.rfind('/');
  return slash == std::string::npos ? argv0 : argv0.substr(slash + 1);
}

std::optional<std::string> decode_address(const std::string &hex, const bool ipv6) {
  // The kernel prints each 32-bit word in host byte order.
  if (!ipv6) {
    const auto word = parse_hex32(hex);
    if (!word.has_value()) {
      return std::nullopt;
    }
    unsigned char bytes[4];
    std::memcpy(bytes, &*word, sizeof(bytes));
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, bytes, buffer, sizeof(buffer)) == nullptr) {
      return std::nullopt;
    }
    return std::string(buffer);
  }

  if (hex.size() != 32) {
    return std::nullopt;
  }
  unsigned char bytes[16];
  for (int i = 0; i < 4; ++i) {
    const auto word = parse_hex32(hex.substr(static_cast<std::size_t>(i) * 8, 8));
    if (!word.has_value()) {
      return std::nullopt;
    }
    std::memcpy(bytes + i * 4, &*word, 4);
  }
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET6, bytes, buffer, sizeof(buffer)) == nullptr) {
    return std::nullopt;
  }
  return std::string(buffer);
}

std::vector<ListenSocket> parse_listen_sockets(const std::string &text, const bool ipv6) {
  std::vector<ListenSocket> sockets;
  std::istringstream lines(text);
  std::string line;
  bool header = true;
  while (std::getline(lines, line)) {
    if (header) {
      header = false;
      continue;
    }
    std::istringstream fields(line);
    std::string slot;
    std::string local;
    std::string remote;
    std::string state;
    if (!(fields >> slot >> local >> remote >> state)) {
      continue;
    }
    if (state != "0A") {
      continue;
    }
    const auto colon = local.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::uint32_t port = 0;
    const std::string port_hex = local.substr(colon + 1);
    auto [ptr, ec] = std::from_chars(port_hex.data(), port_hex.data() + port_hex.size(), port, 16);
    if (ec != std::errc() || port > 0xFFFF) {
      continue;
    }
    const auto address = decode_address(local.substr(0, colon), ipv6);
    if (!address.has_value()) {
      continue;
    }
    sockets.push_back(ListenSocket{.address = *address, .port = static_cast<std::uint16_t>(port)});
  }
  return sockets;
}

std::string normalize_listen_address(const std::string &address) {
  if (address == "::1") {
    return "127.0.0.1";
  }
  if (address == "::") {
    return "0.0.0.0";
  }
  const std::string mapped = "::ffff:";
  if (common::starts_with(common::to_lower(address), mapped) &&
      address.find('.') != std::string::npos) {
    return address.substr(mapped.size());
  }
  return address;
}

} // namespace hostwarden::metrics::procfs
