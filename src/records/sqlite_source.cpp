#include "leakguard/records/sqlite_source.hpp"

#include "leakguard/records/json_codec.hpp"

#include <chrono>

namespace leakguard::records {

namespace {

constexpr const char *kNotInitialized = "records db not initialized";

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

std::string now_unix_string() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace

SqliteRecordSource::SqliteRecordSource(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  if (!db_path_.parent_path().empty()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteRecordSource::~SqliteRecordSource() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteRecordSource::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS confidential_records (
  entity_name TEXT PRIMARY KEY,
  internal_json TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Status SqliteRecordSource::put(const ConfidentialRecord &record) {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  if (record.entity_name.empty()) {
    return common::Status::error("record has no entity name");
  }

  // Upsert keeps the original rowid, so load order stays insertion order.
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO confidential_records(entity_name, internal_json, updated_at) "
                    "VALUES(?1, ?2, ?3) ON CONFLICT(entity_name) DO UPDATE SET "
                    "internal_json = excluded.internal_json, updated_at = excluded.updated_at";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string json = record_to_json(record);
  const std::string now = now_unix_string();
  sqlite3_bind_text(stmt, 1, record.entity_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteRecordSource::put_all(const RecordStore &store) {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized);
  }
  if (auto begin = exec_sql(db_, "BEGIN"); !begin.ok()) {
    return begin;
  }
  for (const auto &record : store.records()) {
    if (auto status = put(record); !status.ok()) {
      (void)exec_sql(db_, "ROLLBACK");
      return status;
    }
  }
  return exec_sql(db_, "COMMIT");
}

common::Result<bool> SqliteRecordSource::remove(const std::string &entity_name) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM confidential_records WHERE entity_name = ?1", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, entity_name.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> SqliteRecordSource::count() {
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM confidential_records", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

common::Result<RecordStore> SqliteRecordSource::load() {
  if (db_ == nullptr) {
    return common::Result<RecordStore>::failure(kNotInitialized);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT entity_name, internal_json FROM confidential_records "
                         "ORDER BY rowid ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<RecordStore>::failure(sqlite3_errmsg(db_));
  }

  RecordStore store;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const auto *name_text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    const auto *json_text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
    const std::string entity_name = name_text == nullptr ? "" : name_text;
    auto record = parse_record_json(entity_name, json_text == nullptr ? "" : json_text);
    if (!record.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<RecordStore>::failure(record.error());
    }
    store.add(std::move(record.value()));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<RecordStore>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<RecordStore>::success(std::move(store));
}

} // namespace leakguard::records
