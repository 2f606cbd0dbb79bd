#pragma once

#include <chrono>
#include <functional>

#include "internal/sync/sync_orchestrator.hpp"
#include "internal/util/periodic_task.hpp"

namespace offline::sync {

/*
  Timer-driven sync plus periodic housekeeping.

  A tick that collides with a run started elsewhere is skipped.
*/
class BackgroundSync {
 public:
  using Housekeeping = std::function<void()>;

  struct Options {
    std::chrono::milliseconds sync_interval{5000};
    std::chrono::milliseconds housekeeping_interval{std::chrono::hours(1)};
    bool                      incremental = false;
  };

  BackgroundSync(SyncOrchestrator& orchestrator, Housekeeping housekeeping, Options options);
  ~BackgroundSync();

  BackgroundSync(const BackgroundSync&)            = delete;
  BackgroundSync& operator=(const BackgroundSync&) = delete;

  // Both idempotent. Start() returns false when already running.
  bool Start();
  void Stop();

  bool IsRunning() const;

 private:
  void SyncTick();
  void HousekeepingTick();

  SyncOrchestrator&  orchestrator_;
  Housekeeping       housekeeping_;
  Options            options_;
  util::PeriodicTask sync_task_;
  util::PeriodicTask housekeeping_task_;
};

} // namespace offline::sync
