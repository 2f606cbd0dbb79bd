#include "background_sync.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::sync {

using offline::observability::IntField;

BackgroundSync::BackgroundSync(SyncOrchestrator& orchestrator, Housekeeping housekeeping, Options options)
    : orchestrator_(orchestrator),
      housekeeping_(std::move(housekeeping)),
      options_(options),
      sync_task_("background-sync", options.sync_interval, [this] { SyncTick(); }),
      housekeeping_task_("housekeeping", options.housekeeping_interval, [this] { HousekeepingTick(); }) {
}

BackgroundSync::~BackgroundSync() {
  Stop();
}

bool BackgroundSync::Start() {
  if (!sync_task_.Start()) return false;
  if (housekeeping_) housekeeping_task_.Start();

  OFFLINE_LOG_INFO("Background sync started", {IntField("interval_ms", options_.sync_interval.count()),
                                               IntField("housekeeping_interval_ms", options_.housekeeping_interval.count())});
  return true;
}

void BackgroundSync::Stop() {
  if (!sync_task_.IsRunning() && !housekeeping_task_.IsRunning()) return;

  sync_task_.Stop();
  housekeeping_task_.Stop();
  OFFLINE_LOG_INFO("Background sync stopped");
}

bool BackgroundSync::IsRunning() const {
  return sync_task_.IsRunning();
}

void BackgroundSync::SyncTick() {
  SyncOptions options;
  options.incremental = options_.incremental;

  try {
    auto result = orchestrator_.Sync(options);
    if (!result.success()) {
      OFFLINE_LOG_WARN("Background sync finished with failures", {IntField("failed", result.failed_count())});
    }
  } catch (const util::AlreadyInProgress&) {
    OFFLINE_LOG_DEBUG("Background sync skipped, a run is already active");
  }
}

void BackgroundSync::HousekeepingTick() {
  housekeeping_();
}

} // namespace offline::sync
