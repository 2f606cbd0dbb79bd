#include "cache_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/housekeeping.hpp"
#include "internal/db/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace offline::cache {

using namespace offline::v1;
using google::protobuf::Value;
using offline::observability::IntField;
using offline::observability::StringField;

namespace {

constexpr double kCriticalAvailableRatio = 0.10;

StorageQuota ComputeQuota(db::Repository& repo, db::Transaction& tx, uint64_t max_bytes) {
  const auto usage = repo.CacheUsageTotals(tx);
  const auto used  = static_cast<int64_t>(usage.bytes + repo.SnapshotBytes(tx));
  const auto total = static_cast<int64_t>(max_bytes);

  StorageQuota quota;
  quota.set_total(total);
  quota.set_used(used);
  quota.set_available(total - used);
  quota.set_critical(static_cast<double>(quota.available()) < kCriticalAvailableRatio * static_cast<double>(total));
  return quota;
}

} // namespace

CacheStore::CacheStore(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("CacheStore requires a repository");
  }
  if (options_.eviction_target_ratio <= 0.0 || options_.eviction_target_ratio > 1.0) {
    throw std::invalid_argument("eviction_target_ratio must be in (0, 1]");
  }
}

std::chrono::milliseconds CacheStore::DefaultTtl(CachePriority priority) const {
  switch (priority) {
    case CACHE_PRIORITY_HIGH:
      return options_.high_ttl;
    case CACHE_PRIORITY_LOW:
      return options_.low_ttl;
    case CACHE_PRIORITY_MEDIUM:
    default:
      return options_.medium_ttl;
  }
}

void CacheStore::Set(const std::string& key, const Value& value, CachePriority priority,
                     std::optional<std::chrono::milliseconds> ttl) {
  db::model::CacheEntryRecord record;
  record.value_json = util::ToJson(value);

  if (Quota().critical()) {
    db::RunHousekeeping(*repository_, util::NowMillis());
    if (Quota().critical()) {
      Evict();
    }
  }

  const uint64_t now         = util::NowMillis();
  record.key                 = key;
  record.priority            = priority == CACHE_PRIORITY_UNSPECIFIED ? CACHE_PRIORITY_MEDIUM : priority;
  record.created_at_ms       = now;
  record.size_bytes          = record.value_json.size();
  record.access_count        = 0;
  record.last_accessed_at_ms = now;
  if (ttl) {
    record.expires_at_ms = now + static_cast<uint64_t>(std::max<int64_t>(0, ttl->count()));
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertCacheEntry(*tx, record), "cache set " + key);
  db::ThrowIfDbError(repository_->DeleteExpiredCacheEntries(*tx, now), "cache expiry sweep");
  tx->Commit();

  OFFLINE_LOG_DEBUG("Cache entry written", {StringField("key", key), IntField("size_bytes", static_cast<int64_t>(record.size_bytes))});
}

void CacheStore::SetWithDefaultTtl(const std::string& key, const Value& value, CachePriority priority) {
  Set(key, value, priority, DefaultTtl(priority));
}

std::optional<Value> CacheStore::Get(const std::string& key) {
  try {
    auto tx    = repository_->Begin();
    auto entry = repository_->GetCacheEntry(*tx, key);
    if (!entry) {
      tx->Rollback();
      return std::nullopt;
    }

    const uint64_t now = util::NowMillis();
    if (entry->expires_at_ms && now >= *entry->expires_at_ms) {
      db::ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "cache expire " + key);
      tx->Commit();
      OFFLINE_LOG_DEBUG("Cache entry expired", {StringField("key", key)});
      return std::nullopt;
    }

    auto value = util::FromJson(entry->value_json);
    db::ThrowIfDbError(repository_->TouchCacheEntry(*tx, key, now), "cache touch " + key);
    tx->Commit();
    return value;
  } catch (const util::StorageError& e) {
    OFFLINE_LOG_WARN("Cache read failed, treating as miss", {StringField("key", key), StringField("error", e.what())});
  } catch (const util::SerializationError& e) {
    OFFLINE_LOG_ERROR("Cached value is unreadable, treating as miss", {StringField("key", key), StringField("error", e.what())});
  }
  return std::nullopt;
}

void CacheStore::Delete(const std::string& key) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "cache delete " + key);
  tx->Commit();
}

StorageQuota CacheStore::Quota() {
  auto tx    = repository_->Begin();
  auto quota = ComputeQuota(*repository_, *tx, options_.max_bytes);
  tx->Commit();
  return quota;
}

CacheStats CacheStore::Stats() {
  auto tx = repository_->Begin();

  CacheStats stats;
  *stats.mutable_quota() = ComputeQuota(*repository_, *tx, options_.max_bytes);
  stats.set_item_count(repository_->CacheUsageTotals(*tx).count);
  tx->Commit();
  return stats;
}

uint64_t CacheStore::Evict() {
  auto tx = repository_->Begin();

  const auto     quota  = ComputeQuota(*repository_, *tx, options_.max_bytes);
  const auto     target = static_cast<int64_t>(options_.eviction_target_ratio * static_cast<double>(options_.max_bytes));
  int64_t        used   = quota.used();
  const int64_t  before = used;
  if (used <= target) {
    tx->Rollback();
    return 0;
  }

  // Pick victims first; the cursor must not observe its own deletes.
  std::vector<std::string> victims;
  {
    db::CacheQuery query;
    query.order = db::CacheOrder::kEviction;

    auto cursor = repository_->ScanCacheEntries(*tx, query);
    while (used > target) {
      auto entry = cursor->Next();
      if (!entry) break;
      victims.push_back(entry->key);
      used -= static_cast<int64_t>(entry->size_bytes);
    }
  }

  for (const auto& key : victims) {
    db::ThrowIfDbError(repository_->DeleteCacheEntry(*tx, key), "cache evict " + key);
  }
  tx->Commit();

  OFFLINE_LOG_INFO("Cache eviction", {IntField("evicted", static_cast<int64_t>(victims.size())), IntField("used_before", before),
                                      IntField("used_after", used), IntField("target", target)});
  return victims.size();
}

void CacheStore::PutSnapshot(const std::string& kind, const std::string& id, const std::string& owner_id,
                             const Value& value) {
  db::model::SnapshotRecord record;
  record.json          = util::ToJson(value);
  record.kind          = kind;
  record.id            = id;
  record.owner_id      = owner_id;
  record.size_bytes    = record.json.size();
  record.updated_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertSnapshot(*tx, record), "snapshot put " + kind + "/" + id);
  tx->Commit();
}

std::optional<Value> CacheStore::GetSnapshot(const std::string& kind, const std::string& id) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->GetSnapshot(*tx, kind, id);
    tx->Commit();
    if (!record) return std::nullopt;
    return util::FromJson(record->json);
  } catch (const util::StorageError& e) {
    OFFLINE_LOG_WARN("Snapshot read failed, treating as miss", {StringField("kind", kind), StringField("id", id), StringField("error", e.what())});
  } catch (const util::SerializationError& e) {
    OFFLINE_LOG_ERROR("Snapshot is unreadable, treating as miss", {StringField("kind", kind), StringField("id", id), StringField("error", e.what())});
  }
  return std::nullopt;
}

void CacheStore::DeleteSnapshot(const std::string& kind, const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteSnapshot(*tx, kind, id), "snapshot delete " + kind + "/" + id);
  tx->Commit();
}

std::vector<Value> CacheStore::ListSnapshots(const std::string& kind, const std::optional<std::string>& owner_id) {
  std::vector<Value> out;
  try {
    db::SnapshotQuery query;
    query.kind     = kind;
    query.owner_id = owner_id;

    auto tx     = repository_->Begin();
    auto cursor = repository_->ScanSnapshots(*tx, query);
    while (auto record = cursor->Next()) {
      out.push_back(util::FromJson(record->json));
    }
    tx->Commit();
  } catch (const util::StorageError& e) {
    OFFLINE_LOG_WARN("Snapshot scan failed", {StringField("kind", kind), StringField("error", e.what())});
    out.clear();
  }
  return out;
}

} // namespace offline::cache
