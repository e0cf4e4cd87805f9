#pragma once

#include "hostwarden/observability/observer.hpp"

#include <memory>

namespace hostwarden::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);
void flush();

void log(LogLevel level, const std::string &component, const std::string &message);
void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);
void log_error(const std::string &component, const std::string &message);

void record_cycle(std::uint64_t cycle, const std::string &overall, std::size_t findings,
                  std::chrono::milliseconds duration);
void record_alert(const std::string &alert_key, const std::string &outcome);
void record_heal(const std::string &action, bool success, const std::string &detail);
void record_check_latency(const std::string &check, std::chrono::milliseconds latency);
void record_reading(const std::string &name, double value);

} // namespace hostwarden::observability
