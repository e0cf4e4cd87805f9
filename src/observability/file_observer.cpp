#include "hostwarden/observability/file_observer.hpp"

namespace hostwarden::observability {

namespace {

std::ofstream open_append(const std::filesystem::path &path) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  return std::ofstream(path, std::ios::app);
}

} // namespace

FileObserver::FileObserver(const std::filesystem::path &path, const LogLevel min_level)
    : file_(open_append(path)), lines_(file_, min_level) {}

void FileObserver::record_event(const ObserverEvent &event) {
  if (file_.is_open()) {
    lines_.record_event(event);
    lines_.flush();
  }
}

void FileObserver::record_metric(const ObserverMetric &metric) {
  if (file_.is_open()) {
    lines_.record_metric(metric);
  }
}

void FileObserver::flush() { lines_.flush(); }

} // namespace hostwarden::observability
