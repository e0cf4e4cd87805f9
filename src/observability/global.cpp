#include "hostwarden/observability/global.hpp"

#include <mutex>

namespace hostwarden::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void flush() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
}

void log(const LogLevel level, const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = level, .component = component, .message = message});
}

void log_debug(const std::string &component, const std::string &message) {
  log(LogLevel::Debug, component, message);
}

void log_info(const std::string &component, const std::string &message) {
  log(LogLevel::Info, component, message);
}

void log_warn(const std::string &component, const std::string &message) {
  log(LogLevel::Warn, component, message);
}

void log_error(const std::string &component, const std::string &message) {
  log(LogLevel::Error, component, message);
}

void record_cycle(const std::uint64_t cycle, const std::string &overall,
                  const std::size_t findings, const std::chrono::milliseconds duration) {
  record_event(CycleCompletedEvent{
      .cycle = cycle, .overall = overall, .findings = findings, .duration = duration});
}

void record_alert(const std::string &alert_key, const std::string &outcome) {
  record_event(AlertDispatchedEvent{.alert_key = alert_key, .outcome = outcome});
}

void record_heal(const std::string &action, const bool success, const std::string &detail) {
  record_event(HealActionEvent{.action = action, .success = success, .detail = detail});
}

void record_check_latency(const std::string &check, const std::chrono::milliseconds latency) {
  record_metric(CheckLatencyMetric{.check = check, .latency = latency});
}

void record_reading(const std::string &name, const double value) {
  record_metric(ReadingMetric{.name = name, .value = value});
}

} // namespace hostwarden::observability
