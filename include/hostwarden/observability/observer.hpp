#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hostwarden::observability {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

[[nodiscard]] std::string_view level_name(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_level(const std::string &text);

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct CycleCompletedEvent {
  std::uint64_t cycle = 0;
  std::string overall;
  std::size_t findings = 0;
  std::chrono::milliseconds duration{0};
};

struct AlertDispatchedEvent {
  std::string alert_key;
  std::string outcome;
};

struct HealActionEvent {
  std::string action;
  bool success = false;
  std::string detail;
};

using ObserverEvent =
    std::variant<LogEvent, CycleCompletedEvent, AlertDispatchedEvent, HealActionEvent>;

struct CheckLatencyMetric {
  std::string check;
  std::chrono::milliseconds latency{0};
};

struct ReadingMetric {
  std::string name;
  double value = 0.0;
};

using ObserverMetric = std::variant<CheckLatencyMetric, ReadingMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hostwarden::observability
