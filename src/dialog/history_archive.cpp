#include "hitlgate/dialog/history_archive.hpp"

#include "hitlgate/dialog/router.hpp"
#include "hitlgate/health/health.hpp"
#include "hitlgate/observability/global.hpp"

namespace hitlgate::dialog {

namespace {

constexpr const char *kNotOpen = "history archive not open";

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
  return text == nullptr ? "" : text;
}

} // namespace

HistoryArchive::HistoryArchive(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message = db_ == nullptr ? "sqlite open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    health::mark_component_error("archive", message);
    return;
  }
  if (const auto status = init_schema(); !status.ok()) {
    health::mark_component_error("archive", status.error());
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  health::mark_component_ok("archive");
}

HistoryArchive::~HistoryArchive() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status HistoryArchive::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS dialog_history (
  row_id INTEGER PRIMARY KEY AUTOINCREMENT,
  workspace TEXT NOT NULL,
  timestamp_ms INTEGER NOT NULL,
  reason TEXT NOT NULL,
  user_input TEXT NOT NULL,
  continued INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_dialog_history_workspace ON dialog_history(workspace);
)");
}

common::Status HistoryArchive::append(const std::string &workspace_key,
                                      const HistoryEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotOpen, common::StatusCode::Unavailable);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO dialog_history(workspace, timestamp_ms, reason, user_input, "
                    "continued) VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, workspace_key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, entry.timestamp_ms);
  sqlite3_bind_text(stmt, 3, entry.reason.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, entry.user_input.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 5, entry.continued ? 1 : 0);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<ArchivedEntry>>
HistoryArchive::entries(const std::optional<std::string> &workspace, const std::size_t limit) {
  using Rows = common::Result<std::vector<ArchivedEntry>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Rows::failure(kNotOpen, common::StatusCode::Unavailable);
  }

  const bool filtered = workspace.has_value() && !workspace->empty();
  const std::string sql =
      std::string("SELECT workspace, timestamp_ms, reason, user_input, continued FROM "
                  "dialog_history ") +
      (filtered ? "WHERE workspace = ?1 " : "") + "ORDER BY row_id DESC LIMIT " +
      std::to_string(limit == 0 ? 1 : limit);

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return Rows::failure(sqlite3_errmsg(db_));
  }
  const std::string key = filtered ? normalize_workspace(*workspace) : "";
  if (filtered) {
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<ArchivedEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ArchivedEntry row;
    row.workspace = column_text(stmt, 0);
    row.entry.timestamp_ms = sqlite3_column_int64(stmt, 1);
    row.entry.reason = column_text(stmt, 2);
    row.entry.user_input = column_text(stmt, 3);
    row.entry.continued = sqlite3_column_int(stmt, 4) != 0;
    out.push_back(std::move(row));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return Rows::failure(sqlite3_errmsg(db_));
  }
  return Rows::success(std::move(out));
}

common::Result<std::size_t> HistoryArchive::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(kNotOpen, common::StatusCode::Unavailable);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM dialog_history", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

void HistoryArchive::on_history_appended(const std::string &workspace_key,
                                         const HistoryEntry &entry) {
  if (const auto status = append(workspace_key, entry); !status.ok()) {
    health::mark_component_error("archive", status.error());
    observability::record_error("archive", status.error());
  }
}

} // namespace hitlgate::dialog
