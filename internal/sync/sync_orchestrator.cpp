#include "sync_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace offline::sync {

using namespace offline::v1;
using offline::observability::BoolField;
using offline::observability::IntField;
using offline::observability::StringField;

SyncOrchestrator::SyncOrchestrator(queue::OperationQueue& queue, ConflictResolver& resolver,
                                   std::shared_ptr<RemoteSync> remote, Options options)
    : queue_(queue), resolver_(resolver), remote_(std::move(remote)), options_(options) {
  if (!remote_) {
    throw std::invalid_argument("SyncOrchestrator requires a remote");
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 10;
  }
}

void SyncOrchestrator::AddListener(std::shared_ptr<SyncListener> listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

template <typename Fn>
void SyncOrchestrator::Notify(Fn&& fn) {
  std::vector<std::shared_ptr<SyncListener>> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) {
    try {
      fn(*listener);
    } catch (const std::exception& e) {
      OFFLINE_LOG_WARN("Sync listener failed", {StringField("error", e.what())});
    }
  }
}

SyncResult SyncOrchestrator::Sync(const SyncOptions& options) {
  bool expected = false;
  if (!in_progress_.compare_exchange_strong(expected, true)) {
    throw util::AlreadyInProgress("sync already in progress");
  }

  struct Reset {
    std::atomic<bool>& flag;
    ~Reset() {
      flag = false;
    }
  } reset{in_progress_};

  return Run(options);
}

SyncResult SyncOrchestrator::ForceSyncEntity(const std::string& entity_type, const std::string& entity_id,
                                             const std::optional<std::string>& owner_id) {
  SyncOptions options;
  options.owner_id    = owner_id;
  options.entity_type = entity_type;
  options.entity_id   = entity_id;
  return Sync(options);
}

std::vector<Operation> SyncOrchestrator::IncrementalChanges(uint64_t since_ms, const std::optional<std::string>& owner_id) {
  db::OperationQuery query;
  query.status           = OPERATION_STATUS_PENDING;
  query.owner_id         = owner_id;
  query.created_after_ms = since_ms;
  return queue_.Query(query);
}

SyncResult SyncOrchestrator::Run(const SyncOptions& options) {
  db::OperationQuery query;
  query.status      = OPERATION_STATUS_PENDING;
  query.owner_id    = options.owner_id;
  query.entity_type = options.entity_type;
  query.entity_id   = options.entity_id;
  query.limit       = options.max_operations;

  const uint64_t last_sync = last_sync_at_ms_.load();
  if (options.incremental && last_sync != 0) {
    query.created_after_ms = last_sync;
  }

  const auto operations = queue_.Query(query);

  OFFLINE_LOG_INFO("Sync started", {IntField("operations", static_cast<int64_t>(operations.size())),
                                    StringField("owner_id", options.owner_id.value_or("")), BoolField("incremental", options.incremental)});
  Notify([&](SyncListener& l) { l.OnSyncStarted(operations.size()); });

  SyncResult result;
  for (std::size_t begin = 0; begin < operations.size(); begin += options_.batch_size) {
    const std::size_t end = std::min(begin + options_.batch_size, operations.size());
    for (std::size_t i = begin; i < end; ++i) {
      Process(operations[i], result);
    }
  }

  result.set_success(result.failed_count() == 0);
  last_sync_at_ms_ = util::NowMillis();

  OFFLINE_LOG_INFO("Sync finished", {BoolField("success", result.success()), IntField("synced", result.synced_count()),
                                     IntField("failed", result.failed_count()), IntField("conflicts", result.conflicts_size())});
  Notify([&](SyncListener& l) { l.OnSyncFinished(result); });
  return result;
}

RemoteOutcome SyncOrchestrator::Dispatch(const Operation& op) {
  try {
    return remote_->Attempt(op);
  } catch (const std::exception& e) {
    throw util::RemoteDispatchError("remote dispatch failed for operation " + op.id() + ": " + e.what());
  }
}

void SyncOrchestrator::Process(const Operation& op, SyncResult& result) {
  const uint32_t next_retry = op.retry_count() + 1;
  OperationOutcome outcome  = OperationOutcome::kFailed;

  try {
    if (!queue_.MarkProcessing(op.id())) {
      OFFLINE_LOG_INFO("Operation no longer pending, skipped", {StringField("operation_id", op.id())});
      return;
    }

    const RemoteOutcome remote = Dispatch(op);

    if (remote.success) {
      queue_.MarkCompleted(op.id());
      result.set_synced_count(result.synced_count() + 1);
      outcome = OperationOutcome::kSynced;
    } else if (remote.conflict && remote.remote_data) {
      auto conflict = resolver_.Resolve(op, *remote.remote_data);
      *result.add_conflicts() = conflict;

      if (conflict.resolution() == RESOLUTION_MANUAL) {
        queue_.MarkFailed(op.id(), next_retry, op.max_retries());
        result.set_failed_count(result.failed_count() + 1);
        outcome = OperationOutcome::kConflictManual;
      } else {
        queue_.MarkCompleted(op.id());
        result.set_synced_count(result.synced_count() + 1);
        outcome = OperationOutcome::kConflictResolved;
      }
    } else {
      std::string error = remote.error;
      if (error.empty()) {
        error = remote.conflict ? "conflict reported without remote data for operation " + op.id()
                                : "remote rejected operation " + op.id();
      }
      queue_.MarkFailed(op.id(), next_retry, op.max_retries());
      result.add_errors(error);
      result.set_failed_count(result.failed_count() + 1);
      OFFLINE_LOG_WARN("Operation sync failed", {StringField("operation_id", op.id()), StringField("error", error)});
    }
  } catch (const std::exception& e) {
    result.add_errors(e.what());
    result.set_failed_count(result.failed_count() + 1);
    OFFLINE_LOG_ERROR("Operation sync failed", {StringField("operation_id", op.id()), StringField("error", e.what())});

    try {
      queue_.MarkFailed(op.id(), next_retry, op.max_retries());
    } catch (const util::StorageError& storage) {
      result.add_errors(storage.what());
      OFFLINE_LOG_ERROR("Could not record failed attempt", {StringField("operation_id", op.id()), StringField("error", storage.what())});
    }
  }

  Notify([&](SyncListener& l) { l.OnOperationFinished(op, outcome); });
}

SyncStatus SyncOrchestrator::Status() {
  SyncStatus status;
  status.set_last_sync_at_ms(last_sync_at_ms_.load());
  status.set_in_progress(in_progress_.load());

  const auto stats = queue_.Stats();
  status.set_pending_count(stats.pending());
  status.set_failed_count(stats.failed());

  try {
    status.set_is_online(remote_->IsOnline());
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("Remote connectivity probe failed", {StringField("error", e.what())});
    status.set_is_online(false);
  }
  return status;
}

} // namespace offline::sync
