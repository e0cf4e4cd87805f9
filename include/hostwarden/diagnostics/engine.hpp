#pragma once

#include "hostwarden/config/schema.hpp"
#include "hostwarden/diagnostics/health.hpp"
#include "hostwarden/metrics/snapshot.hpp"

#include <cstdint>
#include <string>

namespace hostwarden::diagnostics {

namespace keys {

inline constexpr const char *kCpuHigh = "CPU_HIGH";
inline constexpr const char *kLoadHigh = "LOAD_HIGH";
inline constexpr const char *kMemHigh = "MEM_HIGH";
inline constexpr const char *kSwapHigh = "SWAP_HIGH";
inline constexpr const char *kNetDown = "NET_DOWN";
inline constexpr const char *kZombiesHigh = "ZOMBIES_HIGH";
inline constexpr const char *kTempHigh = "TEMP_HIGH";
inline constexpr const char *kSelfHealAttempt = "SELF_HEAL_ATTEMPT";
inline constexpr const char *kSelfHealFail = "SELF_HEAL_FAIL";

[[nodiscard]] std::string disk_high(const std::string &filesystem);
[[nodiscard]] std::string service_state(const std::string &service);
[[nodiscard]] std::string port_unexpected_listen(std::uint16_t port);
[[nodiscard]] std::string port_unexpected_clear(std::uint16_t port);
[[nodiscard]] std::string port_wrong_ip(std::uint16_t port);
[[nodiscard]] std::string collection_error(Subsystem subsystem);

} // namespace keys

struct DiagnosticPolicy {
  config::ThresholdConfig thresholds;
  std::string disk_filesystem = "/";
  std::string network_host;
  std::string process_name;
  std::string service_name;
  bool service_expected_active = true;
  std::uint16_t port = 0;
  bool port_expected_listening = true;
  // "any" accepts every bind address.
  std::string expected_listen_ip = "127.0.0.1";

  [[nodiscard]] static DiagnosticPolicy from_config(const config::Config &config);
};

/// Pure classification of one snapshot. Absent readings produce no subsystem entry,
/// failed readings produce ERROR and never a threshold finding.
[[nodiscard]] DiagnosticResult diagnose(const metrics::MetricSnapshot &snapshot,
                                        const DiagnosticPolicy &policy);

} // namespace hostwarden::diagnostics
