#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace offline::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and ephemeral runtimes.

  Secondary indices mirror the SQLite ones so scans never walk the whole
  table.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // (created_at_ms, id)
  using CreatedKey = std::pair<uint64_t, std::string>;
  // (-priority, last_accessed_at_ms, key): LOW first, oldest access first
  using EvictionKey = std::tuple<int, uint64_t, std::string>;

  struct State {
    std::unordered_map<std::string, model::OperationRecord> operations;
    std::set<CreatedKey>                                    operations_by_created;
    std::map<int, std::set<CreatedKey>>                     operations_by_status;
    std::map<std::string, std::set<CreatedKey>>             operations_by_owner;

    std::unordered_map<std::string, model::CacheEntryRecord> cache;
    std::set<std::pair<uint64_t, std::string>>               cache_by_expiry;
    std::set<EvictionKey>                                    cache_by_eviction;
    uint64_t                                                 cache_bytes = 0;

    std::map<std::pair<std::string, std::string>, model::SnapshotRecord> snapshots;
    uint64_t                                                             snapshot_bytes = 0;

    std::unordered_map<std::string, model::ConflictRecord> conflicts;
    std::set<CreatedKey>                                   conflicts_by_created;
  };

  static void IndexOperation(State& s, const model::OperationRecord& r);
  static void UnindexOperation(State& s, const model::OperationRecord& r);
  static void IndexCacheEntry(State& s, const model::CacheEntryRecord& r);
  static void UnindexCacheEntry(State& s, const model::CacheEntryRecord& r);

  // guards committed_
  std::mutex mutex_;
  // held by the open transaction; writers are serialized
  std::mutex tx_mutex_;
  State      committed_;
};

} // namespace offline::db::memory
