#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/housekeeping.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace offline::v1;
using offline::db::CacheOrder;
using offline::db::CacheQuery;
using offline::db::ConflictQuery;
using offline::db::Drain;
using offline::db::ErrorCode;
using offline::db::OperationQuery;
using offline::db::Repository;
using offline::db::SnapshotQuery;
using offline::db::model::CacheEntryRecord;
using offline::db::model::ConflictRecord;
using offline::db::model::OperationRecord;
using offline::db::model::SnapshotRecord;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

OperationRecord MakeOperation(const std::string& id, uint64_t created_at_ms, OperationStatus status = OPERATION_STATUS_PENDING,
                              const std::string& owner = "u1") {
  OperationRecord r;
  r.id            = id;
  r.kind          = OPERATION_KIND_UPDATE;
  r.entity_type   = "resource";
  r.entity_id     = "entity-" + id;
  r.payload_json  = "{\"id\":\"" + id + "\"}";
  r.created_at_ms = created_at_ms;
  r.max_retries   = 3;
  r.status        = status;
  r.owner_id      = owner;
  return r;
}

CacheEntryRecord MakeEntry(const std::string& key, CachePriority priority, uint64_t last_accessed_at_ms,
                           std::optional<uint64_t> expires_at_ms = std::nullopt) {
  CacheEntryRecord r;
  r.key                 = key;
  r.value_json          = "\"" + key + "\"";
  r.priority            = priority;
  r.created_at_ms       = 1;
  r.expires_at_ms       = expires_at_ms;
  r.size_bytes          = r.value_json.size();
  r.last_accessed_at_ms = last_accessed_at_ms;
  return r;
}

std::vector<std::string> Ids(const std::vector<OperationRecord>& rows) {
  std::vector<std::string> ids;
  for (const auto& r : rows) ids.push_back(r.id);
  return ids;
}

void VerifyOperations(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertOperation(*tx, MakeOperation("op-b", 200)));
  assert(repo.InsertOperation(*tx, MakeOperation("op-a", 100)));
  assert(repo.InsertOperation(*tx, MakeOperation("op-c", 300, OPERATION_STATUS_PENDING, "u2")));
  assert(repo.InsertOperation(*tx, MakeOperation("op-a", 400)).code == ErrorCode::AlreadyExists);
  tx->Commit();

  tx       = repo.Begin();
  auto got = repo.GetOperation(*tx, "op-a");
  assert(got.has_value());
  assert(got->created_at_ms == 100);
  assert(got->payload_json == "{\"id\":\"op-a\"}");
  assert(got->owner_id == "u1");
  assert(!repo.GetOperation(*tx, "missing").has_value());

  OperationQuery pending;
  pending.status = OPERATION_STATUS_PENDING;
  assert((Ids(Drain(*repo.ScanOperations(*tx, pending))) == std::vector<std::string>{"op-a", "op-b", "op-c"}));

  OperationQuery by_owner;
  by_owner.owner_id = "u1";
  assert((Ids(Drain(*repo.ScanOperations(*tx, by_owner))) == std::vector<std::string>{"op-a", "op-b"}));

  OperationQuery after;
  after.created_after_ms = 100;
  after.limit            = 1;
  assert((Ids(Drain(*repo.ScanOperations(*tx, after))) == std::vector<std::string>{"op-b"}));

  OperationQuery entity;
  entity.entity_type = "resource";
  entity.entity_id   = "entity-op-c";
  assert(Drain(*repo.ScanOperations(*tx, entity)).size() == 1);

  assert(repo.UpdateOperationStatus(*tx, "op-a", OPERATION_STATUS_PROCESSING, 0));
  assert(repo.UpdateOperationStatus(*tx, "op-b", OPERATION_STATUS_PROCESSING, 2));
  assert(repo.UpdateOperationStatus(*tx, "missing", OPERATION_STATUS_PROCESSING, 0).code == ErrorCode::NotFound);
  assert(repo.CountOperations(*tx, OPERATION_STATUS_PROCESSING) == 2);
  assert(repo.CountOperations(*tx, OPERATION_STATUS_PENDING) == 1);

  auto reset = repo.ResetOperationStatus(*tx, OPERATION_STATUS_PROCESSING, OPERATION_STATUS_PENDING);
  assert(reset && reset.rows_affected == 2);
  assert(repo.GetOperation(*tx, "op-b")->retry_count == 2);
  assert(repo.CountOperations(*tx, OPERATION_STATUS_PENDING) == 3);

  assert(repo.DeleteOperation(*tx, "op-c").rows_affected == 1);
  assert(repo.DeleteOperation(*tx, "op-c").rows_affected == 0);
  tx->Commit();
}

void VerifyRollback(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertOperation(*tx, MakeOperation("op-rolled-back", 1)));
  assert(repo.GetOperation(*tx, "op-rolled-back").has_value());
  tx->Rollback();

  tx = repo.Begin();
  assert(!repo.GetOperation(*tx, "op-rolled-back").has_value());
  tx->Commit();

  {
    auto abandoned = repo.Begin();
    assert(repo.InsertOperation(*abandoned, MakeOperation("op-abandoned", 1)));
  }

  tx = repo.Begin();
  assert(!repo.GetOperation(*tx, "op-abandoned").has_value());
  tx->Commit();
}

void VerifyCache(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("high-old", CACHE_PRIORITY_HIGH, 10)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("low-new", CACHE_PRIORITY_LOW, 30)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("low-old", CACHE_PRIORITY_LOW, 20)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("medium", CACHE_PRIORITY_MEDIUM, 5, 1000)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("expiring", CACHE_PRIORITY_LOW, 1, 500)));

  CacheQuery eviction;
  eviction.order = CacheOrder::kEviction;
  std::vector<std::string> order;
  for (const auto& e : Drain(*repo.ScanCacheEntries(*tx, eviction))) order.push_back(e.key);
  assert((order == std::vector<std::string>{"expiring", "low-old", "low-new", "medium", "high-old"}));

  CacheQuery expiring;
  expiring.expires_at_or_before_ms = 500;
  assert(Drain(*repo.ScanCacheEntries(*tx, expiring)).size() == 1);

  auto usage = repo.CacheUsageTotals(*tx);
  assert(usage.count == 5);

  assert(repo.TouchCacheEntry(*tx, "low-old", 99));
  auto touched = repo.GetCacheEntry(*tx, "low-old");
  assert(touched->access_count == 1);
  assert(touched->last_accessed_at_ms == 99);

  // replace keeps one row
  auto replacement       = MakeEntry("low-old", CACHE_PRIORITY_HIGH, 100);
  replacement.value_json = "\"replacement\"";
  replacement.size_bytes = replacement.value_json.size();
  assert(repo.UpsertCacheEntry(*tx, replacement));
  assert(repo.GetCacheEntry(*tx, "low-old")->value_json == "\"replacement\"");
  assert(repo.GetCacheEntry(*tx, "low-old")->access_count == 0);
  assert(repo.CacheUsageTotals(*tx).count == 5);

  auto expired = repo.DeleteExpiredCacheEntries(*tx, 500);
  assert(expired && expired.rows_affected == 1);
  assert(!repo.GetCacheEntry(*tx, "expiring").has_value());
  assert(repo.GetCacheEntry(*tx, "medium").has_value());
  assert(repo.GetCacheEntry(*tx, "medium")->expires_at_ms == 1000u);
  assert(!repo.GetCacheEntry(*tx, "high-old")->expires_at_ms.has_value());

  assert(repo.DeleteCacheEntry(*tx, "medium").rows_affected == 1);
  assert(repo.DeleteCacheEntry(*tx, "medium").rows_affected == 0);

  usage = repo.CacheUsageTotals(*tx);
  assert(usage.count == 3);
  assert(usage.bytes == MakeEntry("high-old", CACHE_PRIORITY_HIGH, 0).size_bytes +
                            MakeEntry("low-new", CACHE_PRIORITY_HIGH, 0).size_bytes + replacement.size_bytes);
  tx->Commit();
}

void VerifySnapshots(Repository& repo) {
  auto put = [&](offline::db::Transaction& tx, const std::string& id, const std::string& owner, uint64_t at,
                 const std::string& json) {
    SnapshotRecord r;
    r.kind          = "resource";
    r.id            = id;
    r.owner_id      = owner;
    r.json          = json;
    r.size_bytes    = json.size();
    r.updated_at_ms = at;
    assert(repo.UpsertSnapshot(tx, r));
  };

  auto tx = repo.Begin();
  put(*tx, "s1", "u1", 10, "{\"v\":1}");
  put(*tx, "s2", "u2", 20, "{\"v\":22}");
  put(*tx, "s1", "u1", 30, "{\"v\":333}");

  assert(repo.SnapshotBytes(*tx) == std::string("{\"v\":22}").size() + std::string("{\"v\":333}").size());
  assert(repo.GetSnapshot(*tx, "resource", "s1")->json == "{\"v\":333}");
  assert(!repo.GetSnapshot(*tx, "message", "s1").has_value());

  SnapshotQuery all;
  all.kind  = "resource";
  auto rows = Drain(*repo.ScanSnapshots(*tx, all));
  assert(rows.size() == 2);
  assert(rows[0].id == "s1");
  assert(rows[1].id == "s2");

  SnapshotQuery owned;
  owned.kind     = "resource";
  owned.owner_id = "u2";
  assert(Drain(*repo.ScanSnapshots(*tx, owned)).size() == 1);

  assert(repo.DeleteSnapshot(*tx, "resource", "s2").rows_affected == 1);
  assert(repo.SnapshotBytes(*tx) == std::string("{\"v\":333}").size());
  tx->Commit();
}

void VerifyConflicts(Repository& repo) {
  auto make = [](const std::string& id, uint64_t created, std::optional<uint64_t> resolved_at) {
    ConflictRecord r;
    r.id            = id;
    r.entity_type   = "resource";
    r.entity_id     = "r-" + id;
    r.local_json    = "{\"side\":\"local\"}";
    r.remote_json   = "{\"side\":\"remote\"}";
    r.conflict_type = CONFLICT_TYPE_UPDATE;
    r.resolution    = resolved_at ? RESOLUTION_MERGE : RESOLUTION_MANUAL;
    if (resolved_at) {
      r.merged_json = "{\"side\":\"merged\"}";
      r.resolved_by = "system";
    }
    r.resolved_at_ms = resolved_at;
    r.created_at_ms  = created;
    return r;
  };

  auto tx = repo.Begin();
  assert(repo.InsertConflict(*tx, make("c2", 20, 20)));
  assert(repo.InsertConflict(*tx, make("c1", 10, std::nullopt)));
  assert(repo.InsertConflict(*tx, make("c1", 30, std::nullopt)).code == ErrorCode::AlreadyExists);

  auto merged = repo.GetConflict(*tx, "c2");
  assert(merged->merged_json == "{\"side\":\"merged\"}");
  assert(merged->resolved_at_ms == 20u);
  assert(merged->resolved_by == "system");

  auto open = repo.GetConflict(*tx, "c1");
  assert(!open->resolved_at_ms.has_value());
  assert(open->merged_json.empty());

  ConflictQuery everything;
  auto          rows = Drain(*repo.ScanConflicts(*tx, everything));
  assert(rows.size() == 2);
  assert(rows[0].id == "c1");

  ConflictQuery unresolved;
  unresolved.unresolved_only = true;
  assert(Drain(*repo.ScanConflicts(*tx, unresolved)).size() == 1);

  ConflictQuery by_entity;
  by_entity.entity_type = "resource";
  by_entity.entity_id   = "r-c2";
  assert(Drain(*repo.ScanConflicts(*tx, by_entity)).size() == 1);

  assert(repo.ResolveConflict(*tx, "c1", RESOLUTION_MERGE, 50, "ada", R"({"title":"merged"})"));
  assert(repo.ResolveConflict(*tx, "c1", RESOLUTION_REMOTE_WINS, 60, "bob", "").code == ErrorCode::NotFound);
  assert(repo.ResolveConflict(*tx, "missing", RESOLUTION_REMOTE_WINS, 60, "bob", "").code == ErrorCode::NotFound);

  auto settled = repo.GetConflict(*tx, "c1");
  assert(settled->resolution == RESOLUTION_MERGE);
  assert(settled->merged_json == R"({"title":"merged"})");
  assert(settled->resolved_at_ms == 50u);
  assert(settled->resolved_by == "ada");
  assert(Drain(*repo.ScanConflicts(*tx, unresolved)).empty());
  tx->Commit();
}

void VerifyHousekeeping(Repository& repo) {
  const uint64_t now = offline::util::NowMillis();
  const uint64_t day = offline::util::kMillisPerDay;

  auto tx = repo.Begin();
  assert(repo.InsertOperation(*tx, MakeOperation("hk-completed-old", now - 8 * day, OPERATION_STATUS_COMPLETED)));
  assert(repo.InsertOperation(*tx, MakeOperation("hk-completed-new", now - 1 * day, OPERATION_STATUS_COMPLETED)));
  assert(repo.InsertOperation(*tx, MakeOperation("hk-failed-recent", now - 8 * day, OPERATION_STATUS_FAILED)));
  assert(repo.InsertOperation(*tx, MakeOperation("hk-failed-old", now - 31 * day, OPERATION_STATUS_FAILED)));
  assert(repo.InsertOperation(*tx, MakeOperation("hk-pending-old", now - 60 * day, OPERATION_STATUS_PENDING)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("hk-expired", CACHE_PRIORITY_LOW, 1, now - 1)));
  assert(repo.UpsertCacheEntry(*tx, MakeEntry("hk-live", CACHE_PRIORITY_LOW, 1, now + day)));
  tx->Commit();

  auto report = offline::db::RunHousekeeping(repo, now);
  assert(report.expired_cache_entries() == 1);
  assert(report.completed_operations() == 1);
  assert(report.failed_operations() == 1);

  tx = repo.Begin();
  assert(!repo.GetOperation(*tx, "hk-completed-old").has_value());
  assert(repo.GetOperation(*tx, "hk-completed-new").has_value());
  assert(repo.GetOperation(*tx, "hk-failed-recent").has_value());
  assert(!repo.GetOperation(*tx, "hk-failed-old").has_value());
  assert(repo.GetOperation(*tx, "hk-pending-old").has_value());
  assert(!repo.GetCacheEntry(*tx, "hk-expired").has_value());
  assert(repo.GetCacheEntry(*tx, "hk-live").has_value());
  tx->Commit();
}

void VerifyRestartDurability(const BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();

  auto tx = repo->Begin();
  assert(repo->InsertOperation(*tx, MakeOperation("durable-op", 5)));
  assert(repo->UpsertCacheEntry(*tx, MakeEntry("durable-key", CACHE_PRIORITY_HIGH, 5)));
  tx->Commit();

  backend.restart(repo);

  tx       = repo->Begin();
  auto op  = repo->GetOperation(*tx, "durable-op");
  auto hit = repo->GetCacheEntry(*tx, "durable-key");
  tx->Commit();

  assert(op.has_value());
  assert(op->status == OPERATION_STATUS_PENDING);
  assert(hit.has_value());
  assert(hit->priority == CACHE_PRIORITY_HIGH);
}

BackendFactory MakeMemoryFactory() {
  BackendFactory factory;
  factory.name             = "memory";
  factory.make_repository  = []() { return std::make_shared<offline::db::memory::MemoryRepository>(); };
  factory.supports_restart = []() { return false; };
  factory.restart          = [](std::shared_ptr<Repository>&) {};
  factory.cleanup          = []() {};
  return factory;
}

BackendFactory MakeSqliteFactory() {
  const auto stamp   = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  const auto db_path = (std::filesystem::temp_directory_path() / ("offline_sync_integration_sqlite_" + stamp + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<offline::db::sqlite::SqliteDB>(db_path);
    offline::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<offline::db::sqlite::SqliteRepository>(std::move(db));
  };

  BackendFactory factory;
  factory.name             = "sqlite";
  factory.make_repository  = make_repo;
  factory.supports_restart = []() { return true; };
  factory.restart          = [make_repo](std::shared_ptr<Repository>& repo) {
    repo.reset();
    repo = make_repo();
  };
  factory.cleanup = [db_path]() {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  };
  return factory;
}

void RunBackendSuite(const BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();
    VerifyOperations(*repo);
    VerifyRollback(*repo);
    VerifyCache(*repo);
    VerifySnapshots(*repo);
    VerifyConflicts(*repo);
    VerifyHousekeeping(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "offline_sync_integration_repository_parity: pass\n";
  return 0;
}
