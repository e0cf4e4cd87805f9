#include "hostwarden/observability/log_observer.hpp"

#include "hostwarden/common/fs.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>

namespace hostwarden::observability {

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_level(const std::string &text) {
  const std::string normalized = common::to_lower(common::trim(text));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(out), min_level_(min_level) {}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(std::cerr, min_level) {}

void LogObserver::write_line(const LogLevel level, const std::string &component,
                             const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::ostringstream line;
  line << common::now_rfc3339() << " [" << level_name(level) << "] " << component << ": "
       << message << "\n";
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line.str();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          write_line(evt.level, evt.component, evt.message);
        } else if constexpr (std::is_same_v<T, CycleCompletedEvent>) {
          write_line(LogLevel::Info, "monitor",
                     "cycle " + std::to_string(evt.cycle) + " complete overall=" + evt.overall +
                         " findings=" + std::to_string(evt.findings) +
                         " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, AlertDispatchedEvent>) {
          write_line(LogLevel::Debug, "alerts",
                     "alert.dispatch key=" + evt.alert_key + " outcome=" + evt.outcome);
        } else if constexpr (std::is_same_v<T, HealActionEvent>) {
          write_line(evt.success ? LogLevel::Info : LogLevel::Error, "heal",
                     evt.action + (evt.success ? " succeeded" : " failed") +
                         (evt.detail.empty() ? std::string() : ": " + evt.detail));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CheckLatencyMetric>) {
          write_line(LogLevel::Debug, "metrics",
                     "check." + m.check + ".latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ReadingMetric>) {
          std::ostringstream value;
          value << m.value;
          write_line(LogLevel::Debug, "metrics", m.name + "=" + value.str());
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace hostwarden::observability
