#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if OFFLINE_SYNC_WITH_GRPC
#include "internal/sync/grpc_remote_sync.hpp"
#endif

namespace offline::factory {

using offline::observability::StringField;
using offline::runtime::config::RuntimeConfig;

namespace {

std::chrono::milliseconds HoursToMillis(double hours) {
  return std::chrono::milliseconds(static_cast<int64_t>(hours * static_cast<double>(util::kMillisPerHour)));
}

std::shared_ptr<sync::RemoteSync> BuildRemote(const RuntimeConfig& config) {
  const auto& remote = config.sync().remote();
  if (remote.endpoint().empty()) {
    return nullptr;
  }
#if OFFLINE_SYNC_WITH_GRPC
  return sync::GrpcRemoteSync::Connect(remote.endpoint(), std::chrono::milliseconds(remote.timeout_ms()));
#else
  OFFLINE_LOG_WARN("Remote endpoint configured but gRPC support is not built in", {StringField("endpoint", remote.endpoint())});
  return nullptr;
#endif
}

} // namespace

queue::OperationQueue::Options QueueOptionsFromConfig(const RuntimeConfig& config) {
  queue::OperationQueue::Options options;
  options.default_max_retries = config.queue().max_retries();
  return options;
}

queue::QueueDrainer::Options DrainerOptionsFromConfig(const RuntimeConfig& config) {
  queue::QueueDrainer::Options options;
  options.interval        = std::chrono::milliseconds(config.queue().drain_interval_ms());
  options.operation_delay = std::chrono::milliseconds(config.queue().retry_delay_ms());
  return options;
}

cache::CacheStore::Options CacheOptionsFromConfig(const RuntimeConfig& config) {
  const auto& cache = config.cache();

  cache::CacheStore::Options options;
  options.max_bytes             = static_cast<uint64_t>(cache.max_cache_size_mb() * 1024.0 * 1024.0);
  options.eviction_target_ratio = cache.eviction_target_ratio();
  options.high_ttl              = HoursToMillis(cache.priority_ttl_hours().high());
  options.medium_ttl            = HoursToMillis(cache.priority_ttl_hours().medium());
  options.low_ttl               = HoursToMillis(cache.priority_ttl_hours().low());
  return options;
}

sync::BackgroundSync::Options BackgroundOptionsFromConfig(const RuntimeConfig& config) {
  sync::BackgroundSync::Options options;
  options.sync_interval         = std::chrono::milliseconds(config.sync().interval_ms());
  options.housekeeping_interval = std::chrono::milliseconds(config.sync().housekeeping_interval_ms());
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& storage = config.storage();
  if (storage.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(storage.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  OFFLINE_LOG_INFO("Using in-memory offline store; nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Runtime Build(const RuntimeConfig& config, std::shared_ptr<sync::RemoteSync> remote) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Durable store
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.queue    = std::make_shared<queue::OperationQueue>(runtime.repository, QueueOptionsFromConfig(config));
  runtime.cache    = std::make_shared<cache::CacheStore>(runtime.repository, CacheOptionsFromConfig(config));
  runtime.resolver = std::make_shared<sync::ConflictResolver>(runtime.repository);

  runtime.queue->RecoverInterrupted();

  // ------------------------------------------------------------------
  // Sync
  // ------------------------------------------------------------------
  runtime.remote = remote ? std::move(remote) : BuildRemote(config);
  if (!runtime.remote) {
    OFFLINE_LOG_INFO("No remote configured; sync disabled");
    return runtime;
  }

  sync::SyncOrchestrator::Options sync_options;
  sync_options.batch_size = config.sync().batch_size();
  runtime.orchestrator    = std::make_shared<sync::SyncOrchestrator>(*runtime.queue, *runtime.resolver, runtime.remote, sync_options);

  auto queue         = runtime.queue;
  runtime.background = std::make_unique<sync::BackgroundSync>(
      *runtime.orchestrator, [queue] { queue->ClearOld(); }, BackgroundOptionsFromConfig(config));

  return runtime;
}

} // namespace offline::factory
