#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace offline::util {

using offline::observability::IntField;
using offline::observability::StringField;

namespace {

// Generation of the loop running on this thread; 0 on foreign threads.
thread_local uint64_t t_generation = 0;

} // namespace

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
  JoinStoppedWorker();

  // destroyed by its own tick; the loop exits as soon as the tick returns
  if (stopped_worker_.joinable()) stopped_worker_.detach();
}

void PeriodicTask::JoinStoppedWorker() {
  std::thread worker;
  {
    std::lock_guard lock(mutex_);
    if (!stopped_worker_.joinable() || stopped_worker_.get_id() == std::this_thread::get_id()) return;
    worker = std::move(stopped_worker_);
  }
  worker.join();
}

bool PeriodicTask::Start() {
  JoinStoppedWorker();

  std::lock_guard lock(mutex_);
  if (running_) return false;

  running_ = true;
  ++generation_;
  thread_ = std::thread(&PeriodicTask::Loop, this, generation_);
  OFFLINE_LOG_DEBUG("Periodic task started", {StringField("task", name_), IntField("interval_ms", interval_.count())});
  return true;
}

void PeriodicTask::Stop() {
  std::thread worker;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
    worker   = std::move(thread_);
  }
  cv_.notify_all();

  if (!worker.joinable()) return;

  // Stop() issued from inside the tick cannot join itself.
  if (worker.get_id() == std::this_thread::get_id()) {
    std::thread previous;
    {
      std::lock_guard lock(mutex_);
      previous        = std::move(stopped_worker_);
      stopped_worker_ = std::move(worker);
    }
    if (previous.joinable()) previous.join();
    return;
  }
  worker.join();
  OFFLINE_LOG_DEBUG("Periodic task stopped", {StringField("task", name_)});
}

bool PeriodicTask::IsRunning() const {
  std::lock_guard lock(mutex_);
  return running_;
}

bool PeriodicTask::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(mutex_);
  const uint64_t   generation = t_generation != 0 ? t_generation : generation_;
  return !cv_.wait_for(lock, duration, [&] { return !running_ || generation_ != generation; });
}

void PeriodicTask::Loop(uint64_t generation) {
  t_generation = generation;
  while (SleepFor(interval_)) {
    try {
      tick_();
    } catch (const std::exception& e) {
      OFFLINE_LOG_ERROR("Periodic task tick failed", {StringField("task", name_), StringField("error", e.what())});
    }
  }
}

} // namespace offline::util
