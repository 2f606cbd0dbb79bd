#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/cache_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/queue/operation_queue.hpp"
#include "internal/queue/queue_drainer.hpp"
#include "internal/sync/background_sync.hpp"
#include "internal/sync/conflict_resolver.hpp"
#include "internal/sync/remote_sync.hpp"
#include "internal/sync/sync_orchestrator.hpp"

namespace offline::factory {

/*
  Runtime

  Owns every long-lived component. Members are declared in dependency
  order so destruction tears down background work first.

  orchestrator and background are null when no remote is available.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<queue::OperationQueue>  queue;
  std::shared_ptr<cache::CacheStore>      cache;
  std::shared_ptr<sync::ConflictResolver> resolver;

  std::shared_ptr<sync::RemoteSync>       remote;
  std::shared_ptr<sync::SyncOrchestrator> orchestrator;
  std::unique_ptr<sync::BackgroundSync>   background;
};

queue::OperationQueue::Options  QueueOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config);
queue::QueueDrainer::Options    DrainerOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config);
cache::CacheStore::Options      CacheOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config);
sync::BackgroundSync::Options   BackgroundOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const offline::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backends.
  Operations interrupted by a previous crash are returned to pending
  before this returns. When `remote` is null a gRPC remote is created
  from sync.remote.endpoint if the build supports it.
*/
Runtime Build(const offline::runtime::config::RuntimeConfig& config, std::shared_ptr<sync::RemoteSync> remote = nullptr);

} // namespace offline::factory
