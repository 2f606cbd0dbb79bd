#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/queue/operation_queue.hpp"
#include "internal/sync/conflict_resolver.hpp"
#include "internal/sync/remote_sync.hpp"
#include "offline/v1/types.pb.h"

namespace offline::sync {

struct SyncOptions {
  std::optional<std::string> owner_id;
  std::optional<std::string> entity_type;
  std::optional<std::string> entity_id;

  // only operations created after the last completed run
  bool incremental = false;

  std::optional<std::size_t> max_operations;
};

enum class OperationOutcome {
  kSynced,
  kConflictResolved,
  kConflictManual,
  kFailed,
};

// Callbacks run on the syncing thread; exceptions are logged and dropped.
class SyncListener {
 public:
  virtual ~SyncListener() = default;

  virtual void OnSyncStarted(std::size_t /*operation_count*/) {
  }
  virtual void OnOperationFinished(const offline::v1::Operation& /*op*/, OperationOutcome /*outcome*/) {
  }
  virtual void OnSyncFinished(const offline::v1::SyncResult& /*result*/) {
  }
};

/*
  Pushes pending operations to the remote in fixed-size batches.

  At most one run is active per orchestrator; Sync() and ForceSyncEntity()
  throw util::AlreadyInProgress instead of waiting. Per-operation failures
  are recorded on the queue and in SyncResult.errors and never abort the
  run.
*/
class SyncOrchestrator {
 public:
  struct Options {
    std::size_t batch_size = 10;
  };

  SyncOrchestrator(queue::OperationQueue& queue, ConflictResolver& resolver, std::shared_ptr<RemoteSync> remote,
                   Options options);

  offline::v1::SyncResult Sync(const SyncOptions& options = {});

  offline::v1::SyncResult ForceSyncEntity(const std::string& entity_type, const std::string& entity_id,
                                          const std::optional<std::string>& owner_id = std::nullopt);

  // Pending operations created strictly after since_ms, oldest first.
  std::vector<offline::v1::Operation> IncrementalChanges(uint64_t since_ms,
                                                         const std::optional<std::string>& owner_id = std::nullopt);

  offline::v1::SyncStatus Status();

  bool InProgress() const {
    return in_progress_.load();
  }

  void AddListener(std::shared_ptr<SyncListener> listener);

 private:
  offline::v1::SyncResult Run(const SyncOptions& options);

  void Process(const offline::v1::Operation& op, offline::v1::SyncResult& result);

  RemoteOutcome Dispatch(const offline::v1::Operation& op);

  template <typename Fn>
  void Notify(Fn&& fn);

  queue::OperationQueue&      queue_;
  ConflictResolver&           resolver_;
  std::shared_ptr<RemoteSync> remote_;
  Options                     options_;

  std::atomic<bool>     in_progress_{false};
  std::atomic<uint64_t> last_sync_at_ms_{0};

  std::mutex                                 listeners_mutex_;
  std::vector<std::shared_ptr<SyncListener>> listeners_;
};

} // namespace offline::sync
