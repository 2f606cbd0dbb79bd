#include "queue_drainer.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace offline::queue {

using offline::observability::IntField;
using offline::observability::StringField;

QueueDrainer::QueueDrainer(OperationQueue& queue, Executor executor, Options options)
    : queue_(queue),
      executor_(std::move(executor)),
      options_(options),
      task_("queue-drainer", options.interval, [this] { DrainOnce(); }) {
}

QueueDrainer::~QueueDrainer() {
  Stop();
}

bool QueueDrainer::Start() {
  return task_.Start();
}

void QueueDrainer::Stop() {
  task_.Stop();
}

bool QueueDrainer::Pause() {
  if (options_.operation_delay.count() <= 0) return true;
  if (!task_.IsRunning()) {
    std::this_thread::sleep_for(options_.operation_delay);
    return true;
  }
  return task_.SleepFor(options_.operation_delay);
}

std::size_t QueueDrainer::DrainOnce() {
  bool expected = false;
  if (!draining_.compare_exchange_strong(expected, true)) {
    OFFLINE_LOG_DEBUG("Queue drain already running, tick skipped");
    return 0;
  }

  struct Reset {
    std::atomic<bool>& flag;
    ~Reset() {
      flag = false;
    }
  } reset{draining_};

  std::size_t completed = 0;
  std::size_t attempted = 0;

  auto pending = queue_.Pending();
  for (const auto& op : pending) {
    if (attempted > 0 && !Pause()) break;

    // removed or claimed by a sync run since the snapshot
    if (!queue_.MarkProcessing(op.id())) continue;
    ++attempted;

    bool applied = false;
    try {
      applied = executor_(op);
    } catch (const std::exception& e) {
      OFFLINE_LOG_WARN("Queue executor failed", {StringField("operation_id", op.id()), StringField("error", e.what())});
    }

    if (applied) {
      queue_.MarkCompleted(op.id());
      ++completed;
    } else {
      queue_.MarkFailed(op.id(), op.retry_count() + 1);
    }
  }

  if (attempted > 0) {
    OFFLINE_LOG_INFO("Queue drain finished", {IntField("attempted", static_cast<int64_t>(attempted)),
                                              IntField("completed", static_cast<int64_t>(completed))});
  }
  return completed;
}

} // namespace offline::queue
