#include "memory_repository.hpp"

#include <algorithm>
#include <limits>
#include <vector>

#include "memory_tx.hpp"

namespace offline::db::memory {

namespace v1 = offline::v1;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static bool LimitReached(const std::optional<std::size_t>& limit, std::size_t n) {
  return limit && n >= *limit;
}

// ------------------------------------------------------------------
// Index maintenance
// ------------------------------------------------------------------

void MemoryRepository::IndexOperation(State& s, const model::OperationRecord& r) {
  CreatedKey key{r.created_at_ms, r.id};
  s.operations_by_created.insert(key);
  s.operations_by_status[static_cast<int>(r.status)].insert(key);
  s.operations_by_owner[r.owner_id].insert(key);
}

void MemoryRepository::UnindexOperation(State& s, const model::OperationRecord& r) {
  CreatedKey key{r.created_at_ms, r.id};
  s.operations_by_created.erase(key);

  auto status_it = s.operations_by_status.find(static_cast<int>(r.status));
  if (status_it != s.operations_by_status.end()) {
    status_it->second.erase(key);
    if (status_it->second.empty()) s.operations_by_status.erase(status_it);
  }

  auto owner_it = s.operations_by_owner.find(r.owner_id);
  if (owner_it != s.operations_by_owner.end()) {
    owner_it->second.erase(key);
    if (owner_it->second.empty()) s.operations_by_owner.erase(owner_it);
  }
}

void MemoryRepository::IndexCacheEntry(State& s, const model::CacheEntryRecord& r) {
  if (r.expires_at_ms) s.cache_by_expiry.emplace(*r.expires_at_ms, r.key);
  s.cache_by_eviction.emplace(-static_cast<int>(r.priority), r.last_accessed_at_ms, r.key);
  s.cache_bytes += r.size_bytes;
}

void MemoryRepository::UnindexCacheEntry(State& s, const model::CacheEntryRecord& r) {
  if (r.expires_at_ms) s.cache_by_expiry.erase({*r.expires_at_ms, r.key});
  s.cache_by_eviction.erase({-static_cast<int>(r.priority), r.last_accessed_at_ms, r.key});
  s.cache_bytes -= r.size_bytes;
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, const model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.operations.count(r.id)) return Result::Err(ErrorCode::AlreadyExists, "operation exists: " + r.id);
  s.operations[r.id] = r;
  IndexOperation(s, r);
  return Result::Ok(1);
}

std::optional<model::OperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find(id);
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateOperationStatus(Transaction& t, const std::string& id, v1::OperationStatus status,
                                               uint32_t retry_count) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations.find(id);
  if (it == s.operations.end()) return Result::Err(ErrorCode::NotFound, "operation not found: " + id);

  UnindexOperation(s, it->second);
  it->second.status      = status;
  it->second.retry_count = retry_count;
  IndexOperation(s, it->second);
  return Result::Ok(1);
}

Result MemoryRepository::DeleteOperation(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations.find(id);
  if (it == s.operations.end()) return Result::Ok(0);

  UnindexOperation(s, it->second);
  s.operations.erase(it);
  return Result::Ok(1);
}

std::unique_ptr<Cursor<model::OperationRecord>> MemoryRepository::ScanOperations(Transaction& t,
                                                                                  const OperationQuery& q) {
  const auto& s = TX(t).View();

  static const std::set<CreatedKey> kEmpty;

  // narrowest index first
  const std::set<CreatedKey>* index = &s.operations_by_created;
  if (q.status) {
    auto it = s.operations_by_status.find(static_cast<int>(*q.status));
    index   = it == s.operations_by_status.end() ? &kEmpty : &it->second;
  } else if (q.owner_id) {
    auto it = s.operations_by_owner.find(*q.owner_id);
    index   = it == s.operations_by_owner.end() ? &kEmpty : &it->second;
  }

  auto begin = index->begin();
  if (q.created_after_ms) {
    if (*q.created_after_ms == std::numeric_limits<uint64_t>::max()) {
      begin = index->end();
    } else {
      begin = index->lower_bound({*q.created_after_ms + 1, std::string()});
    }
  }

  std::vector<model::OperationRecord> out;
  for (auto it = begin; it != index->end(); ++it) {
    if (LimitReached(q.limit, out.size())) break;
    if (q.created_before_ms && it->first >= *q.created_before_ms) break;

    const auto& r = s.operations.at(it->second);
    if (q.owner_id && r.owner_id != *q.owner_id) continue;
    if (q.entity_type && r.entity_type != *q.entity_type) continue;
    if (q.entity_id && r.entity_id != *q.entity_id) continue;
    out.push_back(r);
  }
  return std::make_unique<VectorCursor<model::OperationRecord>>(std::move(out));
}

uint64_t MemoryRepository::CountOperations(Transaction& t, v1::OperationStatus status) {
  const auto& s  = TX(t).View();
  auto        it = s.operations_by_status.find(static_cast<int>(status));
  return it == s.operations_by_status.end() ? 0 : it->second.size();
}

Result MemoryRepository::ResetOperationStatus(Transaction& t, v1::OperationStatus from, v1::OperationStatus to) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations_by_status.find(static_cast<int>(from));
  if (it == s.operations_by_status.end() || from == to) return Result::Ok(0);

  const std::set<CreatedKey> keys = it->second;
  for (const auto& key : keys) {
    auto& r = s.operations.at(key.second);
    UnindexOperation(s, r);
    r.status = to;
    IndexOperation(s, r);
  }
  return Result::Ok(keys.size());
}

Result MemoryRepository::DeleteOperationsCreatedBefore(Transaction& t, v1::OperationStatus status,
                                                       uint64_t cutoff_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations_by_status.find(static_cast<int>(status));
  if (it == s.operations_by_status.end()) return Result::Ok(0);

  std::vector<std::string> doomed;
  for (const auto& [created, id] : it->second) {
    if (created >= cutoff_ms) break;
    doomed.push_back(id);
  }

  for (const auto& id : doomed) {
    auto op = s.operations.find(id);
    UnindexOperation(s, op->second);
    s.operations.erase(op);
  }
  return Result::Ok(doomed.size());
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.cache.find(r.key);
  if (it != s.cache.end()) {
    UnindexCacheEntry(s, it->second);
    it->second = r;
  } else {
    s.cache.emplace(r.key, r);
  }
  IndexCacheEntry(s, r);
  return Result::Ok(1);
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.cache.find(key);
  if (it == s.cache.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::TouchCacheEntry(Transaction& t, const std::string& key, uint64_t accessed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.cache.find(key);
  if (it == s.cache.end()) return Result::Ok(0);

  UnindexCacheEntry(s, it->second);
  it->second.access_count += 1;
  it->second.last_accessed_at_ms = accessed_at_ms;
  IndexCacheEntry(s, it->second);
  return Result::Ok(1);
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  auto& s  = TX(t).Mutable();
  auto  it = s.cache.find(key);
  if (it == s.cache.end()) return Result::Ok(0);

  UnindexCacheEntry(s, it->second);
  s.cache.erase(it);
  return Result::Ok(1);
}

std::unique_ptr<Cursor<model::CacheEntryRecord>> MemoryRepository::ScanCacheEntries(Transaction& t,
                                                                                    const CacheQuery& q) {
  const auto& s = TX(t).View();

  auto matches = [&](const model::CacheEntryRecord& r) {
    if (q.priority && r.priority != *q.priority) return false;
    if (q.expires_at_or_before_ms && (!r.expires_at_ms || *r.expires_at_ms > *q.expires_at_or_before_ms)) {
      return false;
    }
    return true;
  };

  std::vector<model::CacheEntryRecord> out;
  if (q.order == CacheOrder::kEviction) {
    for (const auto& key : s.cache_by_eviction) {
      if (LimitReached(q.limit, out.size())) break;
      const auto& r = s.cache.at(std::get<2>(key));
      if (matches(r)) out.push_back(r);
    }
  } else {
    std::set<std::string> keys;
    if (q.expires_at_or_before_ms) {
      for (const auto& [expires, key] : s.cache_by_expiry) {
        if (expires > *q.expires_at_or_before_ms) break;
        keys.insert(key);
      }
    } else {
      for (const auto& [key, _] : s.cache) keys.insert(key);
    }
    for (const auto& key : keys) {
      if (LimitReached(q.limit, out.size())) break;
      const auto& r = s.cache.at(key);
      if (matches(r)) out.push_back(r);
    }
  }
  return std::make_unique<VectorCursor<model::CacheEntryRecord>>(std::move(out));
}

Result MemoryRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms) {
  auto& s = TX(t).Mutable();

  std::vector<std::string> doomed;
  for (const auto& [expires, key] : s.cache_by_expiry) {
    if (expires > now_ms) break;
    doomed.push_back(key);
  }

  for (const auto& key : doomed) {
    auto it = s.cache.find(key);
    UnindexCacheEntry(s, it->second);
    s.cache.erase(it);
  }
  return Result::Ok(doomed.size());
}

CacheUsage MemoryRepository::CacheUsageTotals(Transaction& t) {
  const auto& s = TX(t).View();
  CacheUsage  usage;
  usage.bytes = s.cache_bytes;
  usage.count = s.cache.size();
  return usage;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.snapshots.find({r.kind, r.id});
  if (it != s.snapshots.end()) {
    s.snapshot_bytes -= it->second.size_bytes;
    it->second = r;
  } else {
    s.snapshots.emplace(std::make_pair(r.kind, r.id), r);
  }
  s.snapshot_bytes += r.size_bytes;
  return Result::Ok(1);
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction& t, const std::string& kind,
                                                                   const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.snapshots.find({kind, id});
  if (it == s.snapshots.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteSnapshot(Transaction& t, const std::string& kind, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.snapshots.find({kind, id});
  if (it == s.snapshots.end()) return Result::Ok(0);

  s.snapshot_bytes -= it->second.size_bytes;
  s.snapshots.erase(it);
  return Result::Ok(1);
}

std::unique_ptr<Cursor<model::SnapshotRecord>> MemoryRepository::ScanSnapshots(Transaction& t,
                                                                               const SnapshotQuery& q) {
  const auto& s = TX(t).View();

  // keys are ordered by (kind, id) so one kind is a contiguous range
  std::vector<model::SnapshotRecord> out;
  for (auto it = s.snapshots.lower_bound({q.kind, std::string()}); it != s.snapshots.end(); ++it) {
    if (it->first.first != q.kind) break;
    if (q.owner_id && it->second.owner_id != *q.owner_id) continue;
    out.push_back(it->second);
  }

  std::stable_sort(out.begin(), out.end(), [](const model::SnapshotRecord& a, const model::SnapshotRecord& b) {
    return a.updated_at_ms > b.updated_at_ms;
  });
  if (q.limit && out.size() > *q.limit) out.resize(*q.limit);
  return std::make_unique<VectorCursor<model::SnapshotRecord>>(std::move(out));
}

uint64_t MemoryRepository::SnapshotBytes(Transaction& t) {
  return TX(t).View().snapshot_bytes;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result MemoryRepository::InsertConflict(Transaction& t, const model::ConflictRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.conflicts.count(r.id)) return Result::Err(ErrorCode::AlreadyExists, "conflict exists: " + r.id);
  s.conflicts[r.id] = r;
  s.conflicts_by_created.emplace(r.created_at_ms, r.id);
  return Result::Ok(1);
}

std::optional<model::ConflictRecord> MemoryRepository::GetConflict(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.conflicts.find(id);
  if (it == s.conflicts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::ResolveConflict(Transaction& t, const std::string& id, v1::Resolution resolution,
                                         uint64_t resolved_at_ms, const std::string& resolved_by,
                                         const std::string& merged_json) {
  auto& s  = TX(t).Mutable();
  auto  it = s.conflicts.find(id);
  if (it == s.conflicts.end() || it->second.resolved_at_ms) {
    return Result::Err(ErrorCode::NotFound, "unresolved conflict not found: " + id);
  }

  it->second.resolution     = resolution;
  it->second.resolved_at_ms = resolved_at_ms;
  it->second.resolved_by    = resolved_by;
  it->second.merged_json    = merged_json;
  return Result::Ok(1);
}

std::unique_ptr<Cursor<model::ConflictRecord>> MemoryRepository::ScanConflicts(Transaction& t,
                                                                               const ConflictQuery& q) {
  const auto& s = TX(t).View();

  std::vector<model::ConflictRecord> out;
  for (const auto& [created, id] : s.conflicts_by_created) {
    if (LimitReached(q.limit, out.size())) break;
    const auto& r = s.conflicts.at(id);
    if (q.entity_type && r.entity_type != *q.entity_type) continue;
    if (q.entity_id && r.entity_id != *q.entity_id) continue;
    if (q.unresolved_only && r.resolved_at_ms) continue;
    out.push_back(r);
  }
  return std::make_unique<VectorCursor<model::ConflictRecord>>(std::move(out));
}

} // namespace offline::db::memory
