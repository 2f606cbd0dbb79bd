#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include "internal/queue/operation_queue.hpp"
#include "internal/util/periodic_task.hpp"

namespace offline::queue {

/*
  Background loop that pushes pending operations through an executor.

  Each tick takes every pending operation, oldest first, and waits
  operation_delay between operations. A tick that fires while the
  previous drain is still running is skipped.
*/
class QueueDrainer {
 public:
  // Returns true when the operation was applied remotely.
  using Executor = std::function<bool(const offline::v1::Operation&)>;

  struct Options {
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds operation_delay{100};
  };

  QueueDrainer(OperationQueue& queue, Executor executor, Options options);
  ~QueueDrainer();

  QueueDrainer(const QueueDrainer&)            = delete;
  QueueDrainer& operator=(const QueueDrainer&) = delete;

  // Both idempotent.
  bool Start();
  void Stop();

  bool IsRunning() const {
    return task_.IsRunning();
  }

  bool IsDraining() const {
    return draining_.load();
  }

  // Runs one drain pass on the calling thread. Returns the number of
  // operations completed, or 0 when a pass is already running.
  std::size_t DrainOnce();

 private:
  bool Pause();

  OperationQueue&    queue_;
  Executor           executor_;
  Options            options_;
  std::atomic<bool>  draining_{false};
  util::PeriodicTask task_;
};

} // namespace offline::queue
