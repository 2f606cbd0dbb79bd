#include "sqlite_db.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::db::sqlite {

using offline::observability::StringField;

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg);
  }

  Configure();
  OFFLINE_LOG_INFO("SQLite offline store opened", {StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL keeps readers from other processes unblocked by the writer
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // constraint failures are reported as SQLITE_CONSTRAINT_PRIMARYKEY etc.
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-10000;"); // ~10MB (negative means KB)
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS operations (id TEXT PRIMARY KEY, kind INTEGER NOT NULL, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, payload TEXT NOT NULL, created_at_ms INTEGER NOT NULL, retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL, status INTEGER NOT NULL, owner_id TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS cache_entries (key TEXT PRIMARY KEY, value TEXT NOT NULL, priority INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER, size_bytes INTEGER NOT NULL, access_count INTEGER NOT NULL DEFAULT 0, last_accessed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS snapshots (kind TEXT NOT NULL, id TEXT NOT NULL, owner_id TEXT NOT NULL, json TEXT NOT NULL, size_bytes INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (kind, id));",
      "CREATE TABLE IF NOT EXISTS conflicts (id TEXT PRIMARY KEY, entity_type TEXT NOT NULL, entity_id TEXT NOT NULL, local_version TEXT NOT NULL, remote_version TEXT NOT NULL, merged_version TEXT, conflict_type INTEGER NOT NULL, resolution INTEGER NOT NULL, resolved_at_ms INTEGER, resolved_by TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_operations_status ON operations(status, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_operations_owner ON operations(owner_id, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_cache_expires ON cache_entries(expires_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_cache_priority ON cache_entries(priority, last_accessed_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_snapshots_owner ON snapshots(kind, owner_id);",
      "CREATE INDEX IF NOT EXISTS idx_conflicts_entity ON conflicts(entity_type, entity_id);"};

  std::lock_guard lock(db.TransactionMutex());
  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : kBootstrapSql) {
      db.Exec(sql);
    }
    db.Exec("COMMIT;");
  } catch (const std::exception& e) {
    OFFLINE_LOG_ERROR("SQLite schema bootstrap failed", {StringField("path", db.Path()), StringField("error", e.what())});
    db.Exec("ROLLBACK;");
    throw;
  }
}

} // namespace offline::db::sqlite
