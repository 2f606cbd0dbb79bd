#include "internal/queue/queue_drainer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace offline::v1;
using offline::queue::OperationQueue;
using offline::queue::QueueDrainer;
using offline::util::StructValue;

OperationQueue MakeQueue() {
  return OperationQueue(std::make_shared<offline::db::memory::MemoryRepository>(), OperationQueue::Options{});
}

QueueDrainer::Options FastOptions() {
  QueueDrainer::Options options;
  options.interval        = std::chrono::milliseconds(20);
  options.operation_delay = std::chrono::milliseconds(0);
  return options;
}

void TestDrainOnceAppliesOutcomes() {
  auto queue = MakeQueue();

  const auto ok     = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "ok", StructValue({}), std::nullopt, "u1");
  const auto reject = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "reject", StructValue({}), std::nullopt, "u1");
  const auto boom   = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "boom", StructValue({}), std::nullopt, "u1");

  QueueDrainer drainer(
      queue,
      [](const Operation& op) {
        if (op.entity_id() == "boom") throw std::runtime_error("remote exploded");
        return op.entity_id() == "ok";
      },
      FastOptions());

  assert(drainer.DrainOnce() == 1);
  assert(queue.Get(ok)->status() == OPERATION_STATUS_COMPLETED);

  auto rejected = queue.Get(reject);
  assert(rejected->status() == OPERATION_STATUS_PENDING);
  assert(rejected->retry_count() == 1);

  auto exploded = queue.Get(boom);
  assert(exploded->status() == OPERATION_STATUS_PENDING);
  assert(exploded->retry_count() == 1);

  // two more passes exhaust the default limit of three
  drainer.DrainOnce();
  drainer.DrainOnce();
  assert(queue.Get(reject)->status() == OPERATION_STATUS_FAILED);
  assert(queue.Get(boom)->status() == OPERATION_STATUS_FAILED);
  assert(queue.Pending().empty());
}

void TestOverlappingDrainIsSkipped() {
  auto queue = MakeQueue();
  queue.Enqueue(OPERATION_KIND_CREATE, "resource", "r1", StructValue({}), std::nullopt, "u1");

  QueueDrainer* self   = nullptr;
  std::size_t   nested = 99;

  QueueDrainer drainer(
      queue,
      [&](const Operation&) {
        assert(self->IsDraining());
        nested = self->DrainOnce();
        return true;
      },
      FastOptions());
  self = &drainer;

  assert(drainer.DrainOnce() == 1);
  assert(nested == 0);
  assert(!drainer.IsDraining());
}

void TestOperationsGoneFromQueueAreSkipped() {
  auto       queue = MakeQueue();
  const auto first = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "first", StructValue({}), std::nullopt, "u1");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  const auto removed = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "removed", StructValue({}), std::nullopt, "u1");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  const auto claimed = queue.Enqueue(OPERATION_KIND_CREATE, "resource", "claimed", StructValue({}), std::nullopt, "u1");

  std::vector<std::string> seen;
  QueueDrainer             drainer(
      queue,
      [&](const Operation& op) {
        seen.push_back(op.entity_id());
        if (op.id() == first) {
          queue.Remove(removed);
          assert(queue.MarkProcessing(claimed));
        }
        return true;
      },
      FastOptions());

  assert(drainer.DrainOnce() == 1);
  assert(seen.size() == 1);
  assert(seen[0] == "first");
  assert(queue.Get(claimed)->status() == OPERATION_STATUS_PROCESSING);
}

void TestBackgroundLoopDrainsQueue() {
  auto       queue = MakeQueue();
  const auto id    = queue.Enqueue(OPERATION_KIND_UPDATE, "profile", "u1", StructValue({}), std::nullopt, "u1");

  std::atomic<int> calls{0};
  QueueDrainer     drainer(
      queue,
      [&](const Operation&) {
        ++calls;
        return true;
      },
      FastOptions());

  assert(drainer.Start());
  assert(!drainer.Start());
  assert(drainer.IsRunning());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (queue.Get(id)->status() != OPERATION_STATUS_COMPLETED && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  drainer.Stop();
  drainer.Stop();
  assert(!drainer.IsRunning());
  assert(queue.Get(id)->status() == OPERATION_STATUS_COMPLETED);
  assert(calls.load() == 1);
}

} // namespace

int main() {
  TestDrainOnceAppliesOutcomes();
  TestOverlappingDrainIsSkipped();
  TestOperationsGoneFromQueueAreSkipped();
  TestBackgroundLoopDrainsQueue();

  std::cout << "offline_sync_unit_queue_drainer: pass\n";
  return 0;
}
