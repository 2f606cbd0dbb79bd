#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace offline::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertOperation(Transaction&, const model::OperationRecord&) override;
  std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string&) override;
  Result UpdateOperationStatus(Transaction&, const std::string& id, offline::v1::OperationStatus status,
                               uint32_t retry_count) override;
  Result DeleteOperation(Transaction&, const std::string&) override;
  std::unique_ptr<Cursor<model::OperationRecord>> ScanOperations(Transaction&, const OperationQuery&) override;
  uint64_t CountOperations(Transaction&, offline::v1::OperationStatus status) override;
  Result ResetOperationStatus(Transaction&, offline::v1::OperationStatus from, offline::v1::OperationStatus to) override;
  Result DeleteOperationsCreatedBefore(Transaction&, offline::v1::OperationStatus status, uint64_t cutoff_ms) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string&) override;
  Result TouchCacheEntry(Transaction&, const std::string& key, uint64_t accessed_at_ms) override;
  Result DeleteCacheEntry(Transaction&, const std::string&) override;
  std::unique_ptr<Cursor<model::CacheEntryRecord>> ScanCacheEntries(Transaction&, const CacheQuery&) override;
  Result DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms) override;
  CacheUsage CacheUsageTotals(Transaction&) override;

  Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& kind, const std::string& id) override;
  Result DeleteSnapshot(Transaction&, const std::string& kind, const std::string& id) override;
  std::unique_ptr<Cursor<model::SnapshotRecord>> ScanSnapshots(Transaction&, const SnapshotQuery&) override;
  uint64_t SnapshotBytes(Transaction&) override;

  Result InsertConflict(Transaction&, const model::ConflictRecord&) override;
  std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string&) override;
  Result ResolveConflict(Transaction&, const std::string& id, offline::v1::Resolution resolution,
                         uint64_t resolved_at_ms, const std::string& resolved_by,
                         const std::string& merged_json) override;
  std::unique_ptr<Cursor<model::ConflictRecord>> ScanConflicts(Transaction&, const ConflictQuery&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
