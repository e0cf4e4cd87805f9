#pragma once

#include "hostwarden/common/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace hostwarden::journal {

enum class IncidentKind {
  Alert,
  Heal,
};

[[nodiscard]] std::string_view incident_kind_name(IncidentKind kind);

struct IncidentRecord {
  std::int64_t id = 0;
  std::string recorded_at;
  IncidentKind kind = IncidentKind::Alert;
  std::string alert_key;
  std::string outcome;
  std::string summary;
  std::string detail;
};

/// Append-only history of alert dispatches and heal decisions in SQLite.
class IncidentJournal {
public:
  explicit IncidentJournal(std::filesystem::path db_path);
  ~IncidentJournal();

  IncidentJournal(const IncidentJournal &) = delete;
  IncidentJournal &operator=(const IncidentJournal &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Status record(const IncidentRecord &record);
  /// Newest first.
  [[nodiscard]] common::Result<std::vector<IncidentRecord>> recent(std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count();

private:
  common::Status init_schema();
  static common::Result<IncidentRecord> row_to_record(sqlite3_stmt *stmt);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace hostwarden::journal
