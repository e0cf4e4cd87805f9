#include "hostwarden/journal/incident_journal.hpp"

#include "hostwarden/common/fs.hpp"

namespace hostwarden::journal {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? std::string() : std::string(text);
}

} // namespace

std::string_view incident_kind_name(const IncidentKind kind) {
  return kind == IncidentKind::Heal ? "heal" : "alert";
}

IncidentJournal::IncidentJournal(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  // The CLI reads while the agent writes.
  sqlite3_busy_timeout(db_, 2000);
  const auto schema = init_schema();
  if (!schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

IncidentJournal::~IncidentJournal() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status IncidentJournal::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS incidents (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  recorded_at TEXT NOT NULL,
  kind TEXT NOT NULL,
  alert_key TEXT NOT NULL,
  outcome TEXT NOT NULL,
  summary TEXT NOT NULL,
  detail TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS incidents_key ON incidents(alert_key);
)");
}

common::Status IncidentJournal::record(const IncidentRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("incident journal not open: " + open_error_);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO incidents(recorded_at, kind, alert_key, outcome, summary, detail) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string recorded_at =
      record.recorded_at.empty() ? common::now_rfc3339() : record.recorded_at;
  const std::string kind(incident_kind_name(record.kind));
  sqlite3_bind_text(stmt, 1, recorded_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.alert_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, record.outcome.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, record.summary.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, record.detail.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<IncidentRecord> IncidentJournal::row_to_record(sqlite3_stmt *stmt) {
  IncidentRecord record;
  record.id = sqlite3_column_int64(stmt, 0);
  record.recorded_at = column_text(stmt, 1);
  const std::string kind = column_text(stmt, 2);
  if (kind == "alert") {
    record.kind = IncidentKind::Alert;
  } else if (kind == "heal") {
    record.kind = IncidentKind::Heal;
  } else {
    return common::Result<IncidentRecord>::failure("unknown incident kind '" + kind + "' in row " +
                                                   std::to_string(record.id));
  }
  record.alert_key = column_text(stmt, 3);
  record.outcome = column_text(stmt, 4);
  record.summary = column_text(stmt, 5);
  record.detail = column_text(stmt, 6);
  return common::Result<IncidentRecord>::success(std::move(record));
}

common::Result<std::vector<IncidentRecord>> IncidentJournal::recent(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<IncidentRecord>>::failure("incident journal not open: " +
                                                                open_error_);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT id, recorded_at, kind, alert_key, outcome, summary, detail FROM "
                         "incidents ORDER BY id DESC LIMIT ?1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<IncidentRecord>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<IncidentRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto record = row_to_record(stmt);
    if (!record.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<IncidentRecord>>::failure(record.error());
    }
    out.push_back(std::move(record.value()));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<IncidentRecord>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<IncidentRecord>>::success(std::move(out));
}

common::Result<std::size_t> IncidentJournal::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("incident journal not open: " + open_error_);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM incidents", -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace hostwarden::journal
