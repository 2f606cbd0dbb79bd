#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/cursor.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/model/snapshot_record.hpp"

namespace offline::db {

/*
  Repository abstraction over the durable store.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Writes report failure through Result; reads that cannot reach the
    backend throw util::StorageError
  - Point lookups and the indexed scans below never fall back to full
    table scans:
      operations     by status, by owner_id
      cache_entries  by expires_at, by priority

  The DB is the source of truth for:
    operation queue state
    cached values
    entity snapshots
    conflict history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Operations
  // ---------------------------------------------------------------------

  virtual Result InsertOperation(Transaction&, const model::OperationRecord&) = 0;

  virtual std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string& id) = 0;

  // NotFound when the id is unknown.
  virtual Result UpdateOperationStatus(Transaction&, const std::string& id, offline::v1::OperationStatus status,
                                       uint32_t retry_count) = 0;

  // Ok with rows_affected == 0 when the id is unknown.
  virtual Result DeleteOperation(Transaction&, const std::string& id) = 0;

  virtual std::unique_ptr<Cursor<model::OperationRecord>> ScanOperations(Transaction&, const OperationQuery&) = 0;

  virtual uint64_t CountOperations(Transaction&, offline::v1::OperationStatus status) = 0;

  // Moves every operation in `from` to `to`; rows_affected is the count.
  virtual Result ResetOperationStatus(Transaction&, offline::v1::OperationStatus from, offline::v1::OperationStatus to) = 0;

  virtual Result DeleteOperationsCreatedBefore(Transaction&, offline::v1::OperationStatus status, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Cache entries
  // ---------------------------------------------------------------------

  // Insert or replace by key.
  virtual Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) = 0;

  // access_count += 1, last_accessed_at_ms = accessed_at_ms
  virtual Result TouchCacheEntry(Transaction&, const std::string& key, uint64_t accessed_at_ms) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;

  virtual std::unique_ptr<Cursor<model::CacheEntryRecord>> ScanCacheEntries(Transaction&, const CacheQuery&) = 0;

  // Deletes entries with expires_at_ms <= now_ms.
  virtual Result DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms) = 0;

  virtual CacheUsage CacheUsageTotals(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Snapshots
  // ---------------------------------------------------------------------

  virtual Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& kind, const std::string& id) = 0;

  virtual Result DeleteSnapshot(Transaction&, const std::string& kind, const std::string& id) = 0;

  virtual std::unique_ptr<Cursor<model::SnapshotRecord>> ScanSnapshots(Transaction&, const SnapshotQuery&) = 0;

  virtual uint64_t SnapshotBytes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Conflicts
  // ---------------------------------------------------------------------

  virtual Result InsertConflict(Transaction&, const model::ConflictRecord&) = 0;

  virtual std::optional<model::ConflictRecord> GetConflict(Transaction&, const std::string& id) = 0;

  // Only unresolved rows can be updated; NotFound otherwise. An empty
  // merged_json leaves the row without a merged version.
  virtual Result ResolveConflict(Transaction&, const std::string& id, offline::v1::Resolution resolution,
                                 uint64_t resolved_at_ms, const std::string& resolved_by,
                                 const std::string& merged_json) = 0;

  virtual std::unique_ptr<Cursor<model::ConflictRecord>> ScanConflicts(Transaction&, const ConflictQuery&) = 0;
};

} // namespace offline::db
