#pragma once

#include "hostwarden/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace hostwarden::observability {

class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out, LogLevel min_level = LogLevel::Info);
  explicit LogObserver(LogLevel min_level = LogLevel::Info);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "stderr"; }

private:
  void write_line(LogLevel level, const std::string &component, const std::string &message);

  std::ostream &out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace hostwarden::observability
