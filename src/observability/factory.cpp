#include "hostwarden/observability/factory.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/observability/file_observer.hpp"
#include "hostwarden/observability/log_observer.hpp"
#include "hostwarden/observability/multi_observer.hpp"

namespace hostwarden::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_level(config.logging.level).value_or(LogLevel::Info);
  const auto backends = common::split(common::to_lower(config.logging.backend), ',');
  auto multi = std::make_unique<MultiObserver>();
  bool file_failed = false;
  for (const auto &backend : backends) {
    if (backend == "stderr" || backend == "log") {
      multi->add(std::make_unique<LogObserver>(level));
    } else if (backend == "file") {
      const std::string path = common::expand_path(config.logging.file);
      if (path.empty()) {
        file_failed = true;
        continue;
      }
      auto file = std::make_unique<FileObserver>(path, level);
      if (file->is_open()) {
        multi->add(std::move(file));
      } else {
        file_failed = true;
      }
    }
  }

  if (file_failed) {
    auto fallback = std::make_unique<LogObserver>(level);
    fallback->record_event(LogEvent{.level = LogLevel::Warn,
                                    .component = "logging",
                                    .message = "cannot open log file " + config.logging.file +
                                               ", logging to stderr"});
    bool has_stderr = false;
    for (const auto &backend : backends) {
      has_stderr = has_stderr || backend == "stderr" || backend == "log";
    }
    if (!has_stderr) {
      multi->add(std::move(fallback));
    }
  }

  return multi;
}

} // namespace hostwarden::observability
