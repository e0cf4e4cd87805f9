#pragma once

#include "hostwarden/observability/log_observer.hpp"

#include <filesystem>
#include <fstream>

namespace hostwarden::observability {

class FileObserver final : public IObserver {
public:
  FileObserver(const std::filesystem::path &path, LogLevel min_level);

  [[nodiscard]] bool is_open() const { return file_.is_open(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

private:
  std::ofstream file_;
  LogObserver lines_;
};

} // namespace hostwarden::observability
