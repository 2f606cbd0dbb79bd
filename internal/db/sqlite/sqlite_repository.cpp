#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_params.hpp"
#include "internal/util/errors.hpp"

namespace offline::db::sqlite {

using offline::db::ErrorCode;
using offline::db::Result;

namespace v1 = offline::v1;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw util::StorageError("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return Stmt(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindAll(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            BindI32(st, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(st, idx, v);
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            BindU64(st, idx, v);
          } else {
            BindText(st, idx, v);
          }
        },
        p);
    ++idx;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

std::string LimitSql(const std::optional<std::size_t>& limit) {
  return limit ? " LIMIT " + std::to_string(*limit) : std::string();
}

// ------------------------------------------------------------------
// Row readers
// ------------------------------------------------------------------

const char* kOperationColumns =
    "id,kind,entity_type,entity_id,payload,created_at_ms,retry_count,max_retries,status,owner_id";

model::OperationRecord ReadOperation(sqlite3_stmt* st) {
  model::OperationRecord r;
  r.id            = ColText(st, 0);
  r.kind          = static_cast<v1::OperationKind>(ColI32(st, 1));
  r.entity_type   = ColText(st, 2);
  r.entity_id     = ColText(st, 3);
  r.payload_json  = ColText(st, 4);
  r.created_at_ms = ColU64(st, 5);
  r.retry_count   = static_cast<uint32_t>(ColU64(st, 6));
  r.max_retries   = static_cast<uint32_t>(ColU64(st, 7));
  r.status        = static_cast<v1::OperationStatus>(ColI32(st, 8));
  r.owner_id      = ColText(st, 9);
  return r;
}

const char* kCacheColumns =
    "key,value,priority,created_at_ms,expires_at_ms,size_bytes,access_count,last_accessed_at_ms";

model::CacheEntryRecord ReadCacheEntry(sqlite3_stmt* st) {
  model::CacheEntryRecord r;
  r.key                 = ColText(st, 0);
  r.value_json          = ColText(st, 1);
  r.priority            = static_cast<v1::CachePriority>(ColI32(st, 2));
  r.created_at_ms       = ColU64(st, 3);
  r.expires_at_ms       = ColOptU64(st, 4);
  r.size_bytes          = ColU64(st, 5);
  r.access_count        = ColU64(st, 6);
  r.last_accessed_at_ms = ColU64(st, 7);
  return r;
}

const char* kSnapshotColumns = "kind,id,owner_id,json,size_bytes,updated_at_ms";

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.kind          = ColText(st, 0);
  r.id            = ColText(st, 1);
  r.owner_id      = ColText(st, 2);
  r.json          = ColText(st, 3);
  r.size_bytes    = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

const char* kConflictColumns =
    "id,entity_type,entity_id,local_version,remote_version,merged_version,conflict_type,resolution,"
    "resolved_at_ms,resolved_by,created_at_ms";

model::ConflictRecord ReadConflict(sqlite3_stmt* st) {
  model::ConflictRecord r;
  r.id             = ColText(st, 0);
  r.entity_type    = ColText(st, 1);
  r.entity_id      = ColText(st, 2);
  r.local_json     = ColText(st, 3);
  r.remote_json    = ColText(st, 4);
  r.merged_json    = ColText(st, 5);
  r.conflict_type  = static_cast<v1::ConflictType>(ColI32(st, 6));
  r.resolution     = static_cast<v1::Resolution>(ColI32(st, 7));
  r.resolved_at_ms = ColOptU64(st, 8);
  r.resolved_by    = ColText(st, 9);
  r.created_at_ms  = ColU64(st, 10);
  return r;
}

/*
  Steps a prepared statement on demand. The statement is finalized as
  soon as the last row has been read.
*/
template <typename T>
class SqliteCursor final : public Cursor<T> {
 public:
  using Reader = T (*)(sqlite3_stmt*);

  SqliteCursor(sqlite3* db, Stmt st, Reader reader) : db_(db), st_(std::move(st)), reader_(reader) {
  }

  std::optional<T> Next() override {
    if (!st_) return std::nullopt;

    int rc = sqlite3_step(st_.get());
    if (rc == SQLITE_ROW) return reader_(st_.get());

    st_.reset();
    if (rc != SQLITE_DONE) {
      throw util::StorageError("sqlite step: " + std::string(sqlite3_errmsg(db_)));
    }
    return std::nullopt;
  }

 private:
  sqlite3* db_;
  Stmt     st_;
  Reader   reader_;
};

template <typename T>
std::optional<T> QueryOne(sqlite3* db, Stmt st, T (*reader)(sqlite3_stmt*)) {
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return reader(st.get());
  if (rc != SQLITE_DONE) {
    throw util::StorageError("sqlite step: " + std::string(sqlite3_errmsg(db)));
  }
  return std::nullopt;
}

uint64_t QueryU64(sqlite3* db, Stmt st) {
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ColU64(st.get(), 0);
  if (rc != SQLITE_DONE) {
    throw util::StorageError("sqlite step: " + std::string(sqlite3_errmsg(db)));
  }
  return 0;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok(sqlite3_changes(db));

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

namespace {

// Prepare failures on writes are reported through Result like step failures.
template <typename BindFn>
Result ExecWrite(sqlite3* db, const std::string& sql, BindFn&& bind, Result (*translate)(sqlite3*, int)) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw, &sqlite3_finalize);
  bind(st.get());

  int rc = sqlite3_step(st.get());
  return translate(db, rc);
}

} // namespace

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result SqliteRepository::InsertOperation(Transaction& t, const model::OperationRecord& r) {
  return ExecWrite(
      TX(t).Handle(),
      "INSERT INTO operations(id,kind,entity_type,entity_id,payload,created_at_ms,retry_count,max_retries,status,"
      "owner_id) VALUES(?,?,?,?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.id);
        BindI32(st, 2, static_cast<int>(r.kind));
        BindText(st, 3, r.entity_type);
        BindText(st, 4, r.entity_id);
        BindText(st, 5, r.payload_json);
        BindU64(st, 6, r.created_at_ms);
        BindU64(st, 7, r.retry_count);
        BindU64(st, 8, r.max_retries);
        BindI32(st, 9, static_cast<int>(r.status));
        BindText(st, 10, r.owner_id);
      },
      &Translate);
}

std::optional<model::OperationRecord> SqliteRepository::GetOperation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kOperationColumns + " FROM operations WHERE id=?;");
  BindText(st.get(), 1, id);
  return QueryOne(db, std::move(st), &ReadOperation);
}

Result SqliteRepository::UpdateOperationStatus(Transaction& t, const std::string& id, v1::OperationStatus status,
                                               uint32_t retry_count) {
  auto r = ExecWrite(
      TX(t).Handle(), "UPDATE operations SET status=?,retry_count=? WHERE id=?;",
      [&](sqlite3_stmt* st) {
        BindI32(st, 1, static_cast<int>(status));
        BindU64(st, 2, retry_count);
        BindText(st, 3, id);
      },
      &Translate);
  if (r && r.rows_affected == 0) return Result::Err(ErrorCode::NotFound, "operation not found: " + id);
  return r;
}

Result SqliteRepository::DeleteOperation(Transaction& t, const std::string& id) {
  return ExecWrite(
      TX(t).Handle(), "DELETE FROM operations WHERE id=?;", [&](sqlite3_stmt* st) { BindText(st, 1, id); }, &Translate);
}

std::unique_ptr<Cursor<model::OperationRecord>> SqliteRepository::ScanOperations(Transaction& t,
                                                                                  const OperationQuery& q) {
  auto* db = TX(t).Handle();

  sql::WhereClause where;
  if (q.status) where.Add("status=?", static_cast<int32_t>(*q.status));
  if (q.owner_id) where.Add("owner_id=?", *q.owner_id);
  if (q.entity_type) where.Add("entity_type=?", *q.entity_type);
  if (q.entity_id) where.Add("entity_id=?", *q.entity_id);
  if (q.created_after_ms) where.Add("created_at_ms>?", *q.created_after_ms);
  if (q.created_before_ms) where.Add("created_at_ms<?", *q.created_before_ms);

  auto st = Prepare(db, std::string("SELECT ") + kOperationColumns + " FROM operations" + where.Sql() +
                            " ORDER BY created_at_ms ASC, id ASC" + LimitSql(q.limit) + ";");
  BindAll(st.get(), where.MutableParams());
  return std::make_unique<SqliteCursor<model::OperationRecord>>(db, std::move(st), &ReadOperation);
}

uint64_t SqliteRepository::CountOperations(Transaction& t, v1::OperationStatus status) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM operations WHERE status=?;");
  BindI32(st.get(), 1, static_cast<int>(status));
  return QueryU64(db, std::move(st));
}

Result SqliteRepository::ResetOperationStatus(Transaction& t, v1::OperationStatus from, v1::OperationStatus to) {
  return ExecWrite(
      TX(t).Handle(), "UPDATE operations SET status=? WHERE status=?;",
      [&](sqlite3_stmt* st) {
        BindI32(st, 1, static_cast<int>(to));
        BindI32(st, 2, static_cast<int>(from));
      },
      &Translate);
}

Result SqliteRepository::DeleteOperationsCreatedBefore(Transaction& t, v1::OperationStatus status,
                                                       uint64_t cutoff_ms) {
  return ExecWrite(
      TX(t).Handle(), "DELETE FROM operations WHERE status=? AND created_at_ms<?;",
      [&](sqlite3_stmt* st) {
        BindI32(st, 1, static_cast<int>(status));
        BindU64(st, 2, cutoff_ms);
      },
      &Translate);
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  return ExecWrite(
      TX(t).Handle(),
      "INSERT OR REPLACE INTO cache_entries(key,value,priority,created_at_ms,expires_at_ms,size_bytes,access_count,"
      "last_accessed_at_ms) VALUES(?,?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.key);
        BindText(st, 2, r.value_json);
        BindI32(st, 3, static_cast<int>(r.priority));
        BindU64(st, 4, r.created_at_ms);
        BindOptU64(st, 5, r.expires_at_ms);
        BindU64(st, 6, r.size_bytes);
        BindU64(st, 7, r.access_count);
        BindU64(st, 8, r.last_accessed_at_ms);
      },
      &Translate);
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kCacheColumns + " FROM cache_entries WHERE key=?;");
  BindText(st.get(), 1, key);
  return QueryOne(db, std::move(st), &ReadCacheEntry);
}

Result SqliteRepository::TouchCacheEntry(Transaction& t, const std::string& key, uint64_t accessed_at_ms) {
  return ExecWrite(
      TX(t).Handle(), "UPDATE cache_entries SET access_count=access_count+1,last_accessed_at_ms=? WHERE key=?;",
      [&](sqlite3_stmt* st) {
        BindU64(st, 1, accessed_at_ms);
        BindText(st, 2, key);
      },
      &Translate);
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  return ExecWrite(
      TX(t).Handle(), "DELETE FROM cache_entries WHERE key=?;", [&](sqlite3_stmt* st) { BindText(st, 1, key); },
      &Translate);
}

std::unique_ptr<Cursor<model::CacheEntryRecord>> SqliteRepository::ScanCacheEntries(Transaction& t,
                                                                                    const CacheQuery& q) {
  auto* db = TX(t).Handle();

  sql::WhereClause where;
  if (q.priority) where.Add("priority=?", static_cast<int32_t>(*q.priority));
  if (q.expires_at_or_before_ms) where.Add("expires_at_ms<=?", *q.expires_at_or_before_ms);

  // LOW=3 sorts first for eviction
  const char* order = q.order == CacheOrder::kEviction ? " ORDER BY priority DESC, last_accessed_at_ms ASC, key ASC"
                                                       : " ORDER BY key ASC";

  auto st = Prepare(db, std::string("SELECT ") + kCacheColumns + " FROM cache_entries" + where.Sql() + order +
                            LimitSql(q.limit) + ";");
  BindAll(st.get(), where.MutableParams());
  return std::make_unique<SqliteCursor<model::CacheEntryRecord>>(db, std::move(st), &ReadCacheEntry);
}

Result SqliteRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms) {
  return ExecWrite(
      TX(t).Handle(), "DELETE FROM cache_entries WHERE expires_at_ms IS NOT NULL AND expires_at_ms<=?;",
      [&](sqlite3_stmt* st) { BindU64(st, 1, now_ms); }, &Translate);
}

CacheUsage SqliteRepository::CacheUsageTotals(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COALESCE(SUM(size_bytes),0), COUNT(*) FROM cache_entries;");

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    throw util::StorageError("sqlite step: " + std::string(sqlite3_errmsg(db)));
  }

  CacheUsage usage;
  usage.bytes = ColU64(st.get(), 0);
  usage.count = ColU64(st.get(), 1);
  return usage;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  return ExecWrite(
      TX(t).Handle(),
      "INSERT OR REPLACE INTO snapshots(kind,id,owner_id,json,size_bytes,updated_at_ms) VALUES(?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.kind);
        BindText(st, 2, r.id);
        BindText(st, 3, r.owner_id);
        BindText(st, 4, r.json);
        BindU64(st, 5, r.size_bytes);
        BindU64(st, 6, r.updated_at_ms);
      },
      &Translate);
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshot(Transaction& t, const std::string& kind,
                                                                   const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kSnapshotColumns + " FROM snapshots WHERE kind=? AND id=?;");
  BindText(st.get(), 1, kind);
  BindText(st.get(), 2, id);
  return QueryOne(db, std::move(st), &ReadSnapshot);
}

Result SqliteRepository::DeleteSnapshot(Transaction& t, const std::string& kind, const std::string& id) {
  return ExecWrite(
      TX(t).Handle(), "DELETE FROM snapshots WHERE kind=? AND id=?;",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, kind);
        BindText(st, 2, id);
      },
      &Translate);
}

std::unique_ptr<Cursor<model::SnapshotRecord>> SqliteRepository::ScanSnapshots(Transaction& t,
                                                                               const SnapshotQuery& q) {
  auto* db = TX(t).Handle();

  sql::WhereClause where;
  where.Add("kind=?", q.kind);
  if (q.owner_id) where.Add("owner_id=?", *q.owner_id);

  auto st = Prepare(db, std::string("SELECT ") + kSnapshotColumns + " FROM snapshots" + where.Sql() +
                            " ORDER BY updated_at_ms DESC, id ASC" + LimitSql(q.limit) + ";");
  BindAll(st.get(), where.MutableParams());
  return std::make_unique<SqliteCursor<model::SnapshotRecord>>(db, std::move(st), &ReadSnapshot);
}

uint64_t SqliteRepository::SnapshotBytes(Transaction& t) {
  auto* db = TX(t).Handle();
  return QueryU64(db, Prepare(db, "SELECT COALESCE(SUM(size_bytes),0) FROM snapshots;"));
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result SqliteRepository::InsertConflict(Transaction& t, const model::ConflictRecord& r) {
  return ExecWrite(
      TX(t).Handle(),
      "INSERT INTO conflicts(id,entity_type,entity_id,local_version,remote_version,merged_version,conflict_type,"
      "resolution,resolved_at_ms,resolved_by,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);",
      [&](sqlite3_stmt* st) {
        BindText(st, 1, r.id);
        BindText(st, 2, r.entity_type);
        BindText(st, 3, r.entity_id);
        BindText(st, 4, r.local_json);
        BindText(st, 5, r.remote_json);
        if (r.merged_json.empty()) {
          sqlite3_bind_null(st, 6);
        } else {
          BindText(st, 6, r.merged_json);
        }
        BindI32(st, 7, static_cast<int>(r.conflict_type));
        BindI32(st, 8, static_cast<int>(r.resolution));
        BindOptU64(st, 9, r.resolved_at_ms);
        BindText(st, 10, r.resolved_by);
        BindU64(st, 11, r.created_at_ms);
      },
      &Translate);
}

std::optional<model::ConflictRecord> SqliteRepository::GetConflict(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kConflictColumns + " FROM conflicts WHERE id=?;");
  BindText(st.get(), 1, id);
  return QueryOne(db, std::move(st), &ReadConflict);
}

Result SqliteRepository::ResolveConflict(Transaction& t, const std::string& id, v1::Resolution resolution,
                                         uint64_t resolved_at_ms, const std::string& resolved_by,
                                         const std::string& merged_json) {
  auto r = ExecWrite(
      TX(t).Handle(),
      "UPDATE conflicts SET resolution=?,resolved_at_ms=?,resolved_by=?,merged_version=? "
      "WHERE id=? AND resolved_at_ms IS NULL;",
      [&](sqlite3_stmt* st) {
        BindI32(st, 1, static_cast<int>(resolution));
        BindU64(st, 2, resolved_at_ms);
        BindText(st, 3, resolved_by);
        if (merged_json.empty()) {
          sqlite3_bind_null(st, 4);
        } else {
          BindText(st, 4, merged_json);
        }
        BindText(st, 5, id);
      },
      &Translate);
  if (r && r.rows_affected == 0) return Result::Err(ErrorCode::NotFound, "unresolved conflict not found: " + id);
  return r;
}

std::unique_ptr<Cursor<model::ConflictRecord>> SqliteRepository::ScanConflicts(Transaction& t,
                                                                               const ConflictQuery& q) {
  auto* db = TX(t).Handle();

  sql::WhereClause where;
  if (q.entity_type) where.Add("entity_type=?", *q.entity_type);
  if (q.entity_id) where.Add("entity_id=?", *q.entity_id);
  if (q.unresolved_only) where.AddRaw("resolved_at_ms IS NULL");

  auto st = Prepare(db, std::string("SELECT ") + kConflictColumns + " FROM conflicts" + where.Sql() +
                            " ORDER BY created_at_ms ASC, id ASC" + LimitSql(q.limit) + ";");
  BindAll(st.get(), where.MutableParams());
  return std::make_unique<SqliteCursor<model::ConflictRecord>>(db, std::move(st), &ReadConflict);
}

} // namespace offline::db::sqlite
