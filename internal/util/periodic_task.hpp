#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace offline::util {

/*
  Background thread that runs a callback on a fixed interval.

  Start() while running and Stop() while stopped are no-ops, so owners
  can call both freely. The first tick runs one full interval after Start().

  Stop() from inside the tick cannot join its own thread; that thread is
  joined by the next Start() or by the destructor, so the task never
  outlives its worker.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  // Returns false when the task was already running.
  bool Start();
  void Stop();

  bool IsRunning() const;

  // Interruptible sleep for use inside the tick. Returns false once Stop()
  // has been requested.
  bool SleepFor(std::chrono::milliseconds duration);

 private:
  void Loop(uint64_t generation);
  void JoinStoppedWorker();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     tick_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_    = false;
  uint64_t                generation_ = 0;
  std::thread             thread_;
  // worker that stopped itself from inside its tick
  std::thread             stopped_worker_;
};

} // namespace offline::util
