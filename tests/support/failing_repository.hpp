#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace offline::testing {

/*
  MemoryRepository wrapper that can simulate an unreachable backend.

  fail_reads:  operation scans and cache lookups throw util::StorageError
  fail_writes: operation inserts and cache upserts report IOError
*/
class FailingRepository final : public db::Repository {
 public:
  std::atomic<bool> fail_reads{false};
  std::atomic<bool> fail_writes{false};

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertOperation(db::Transaction& tx, const db::model::OperationRecord& r) override {
    if (fail_writes) return db::Result::Err(db::ErrorCode::IOError, "disk unavailable");
    return inner_.InsertOperation(tx, r);
  }
  std::optional<db::model::OperationRecord> GetOperation(db::Transaction& tx, const std::string& id) override {
    return inner_.GetOperation(tx, id);
  }
  db::Result UpdateOperationStatus(db::Transaction& tx, const std::string& id, offline::v1::OperationStatus status,
                                   uint32_t retry_count) override {
    return inner_.UpdateOperationStatus(tx, id, status, retry_count);
  }
  db::Result DeleteOperation(db::Transaction& tx, const std::string& id) override {
    return inner_.DeleteOperation(tx, id);
  }
  std::unique_ptr<db::Cursor<db::model::OperationRecord>> ScanOperations(db::Transaction& tx,
                                                                         const db::OperationQuery& q) override {
    if (fail_reads) throw util::StorageError("disk unavailable");
    return inner_.ScanOperations(tx, q);
  }
  uint64_t CountOperations(db::Transaction& tx, offline::v1::OperationStatus status) override {
    return inner_.CountOperations(tx, status);
  }
  db::Result ResetOperationStatus(db::Transaction& tx, offline::v1::OperationStatus from,
                                  offline::v1::OperationStatus to) override {
    return inner_.ResetOperationStatus(tx, from, to);
  }
  db::Result DeleteOperationsCreatedBefore(db::Transaction& tx, offline::v1::OperationStatus status,
                                           uint64_t cutoff_ms) override {
    return inner_.DeleteOperationsCreatedBefore(tx, status, cutoff_ms);
  }

  db::Result UpsertCacheEntry(db::Transaction& tx, const db::model::CacheEntryRecord& r) override {
    if (fail_writes) return db::Result::Err(db::ErrorCode::IOError, "disk unavailable");
    return inner_.UpsertCacheEntry(tx, r);
  }
  std::optional<db::model::CacheEntryRecord> GetCacheEntry(db::Transaction& tx, const std::string& key) override {
    if (fail_reads) throw util::StorageError("disk unavailable");
    return inner_.GetCacheEntry(tx, key);
  }
  db::Result TouchCacheEntry(db::Transaction& tx, const std::string& key, uint64_t accessed_at_ms) override {
    return inner_.TouchCacheEntry(tx, key, accessed_at_ms);
  }
  db::Result DeleteCacheEntry(db::Transaction& tx, const std::string& key) override {
    return inner_.DeleteCacheEntry(tx, key);
  }
  std::unique_ptr<db::Cursor<db::model::CacheEntryRecord>> ScanCacheEntries(db::Transaction& tx,
                                                                           const db::CacheQuery& q) override {
    return inner_.ScanCacheEntries(tx, q);
  }
  db::Result DeleteExpiredCacheEntries(db::Transaction& tx, uint64_t now_ms) override {
    return inner_.DeleteExpiredCacheEntries(tx, now_ms);
  }
  db::CacheUsage CacheUsageTotals(db::Transaction& tx) override {
    return inner_.CacheUsageTotals(tx);
  }

  db::Result UpsertSnapshot(db::Transaction& tx, const db::model::SnapshotRecord& r) override {
    return inner_.UpsertSnapshot(tx, r);
  }
  std::optional<db::model::SnapshotRecord> GetSnapshot(db::Transaction& tx, const std::string& kind,
                                                       const std::string& id) override {
    return inner_.GetSnapshot(tx, kind, id);
  }
  db::Result DeleteSnapshot(db::Transaction& tx, const std::string& kind, const std::string& id) override {
    return inner_.DeleteSnapshot(tx, kind, id);
  }
  std::unique_ptr<db::Cursor<db::model::SnapshotRecord>> ScanSnapshots(db::Transaction& tx,
                                                                       const db::SnapshotQuery& q) override {
    return inner_.ScanSnapshots(tx, q);
  }
  uint64_t SnapshotBytes(db::Transaction& tx) override {
    return inner_.SnapshotBytes(tx);
  }

  db::Result InsertConflict(db::Transaction& tx, const db::model::ConflictRecord& r) override {
    return inner_.InsertConflict(tx, r);
  }
  std::optional<db::model::ConflictRecord> GetConflict(db::Transaction& tx, const std::string& id) override {
    return inner_.GetConflict(tx, id);
  }
  db::Result ResolveConflict(db::Transaction& tx, const std::string& id, offline::v1::Resolution resolution,
                             uint64_t resolved_at_ms, const std::string& resolved_by,
                             const std::string& merged_json) override {
    return inner_.ResolveConflict(tx, id, resolution, resolved_at_ms, resolved_by, merged_json);
  }
  std::unique_ptr<db::Cursor<db::model::ConflictRecord>> ScanConflicts(db::Transaction& tx,
                                                                       const db::ConflictQuery& q) override {
    return inner_.ScanConflicts(tx, q);
  }

 private:
  db::memory::MemoryRepository inner_;
};

} // namespace offline::testing
