#include "internal/queue/operation_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using namespace offline::v1;
using offline::queue::OperationQueue;
using offline::util::NumberValue;
using offline::util::StringValue;
using offline::util::StructValue;

std::unique_ptr<OperationQueue> MakeQueue() {
  return std::make_unique<OperationQueue>(std::make_shared<offline::db::memory::MemoryRepository>(), OperationQueue::Options{});
}

// created_at_ms has millisecond resolution; keep enqueue order observable.
void Tick() {
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
}

void TestPendingIsOldestFirstAndFilteredByOwner() {
  auto queue = MakeQueue();

  const auto first = queue->Enqueue(OPERATION_KIND_CREATE, "resource", "r1", StructValue({{"title", StringValue("A")}}),
                                    std::nullopt, "u1");
  Tick();
  const auto second = queue->Enqueue(OPERATION_KIND_UPDATE, "message", "m1", StructValue({{"body", StringValue("hi")}}),
                                     std::nullopt, "u2");
  Tick();
  const auto third = queue->Enqueue(OPERATION_KIND_DELETE, "resource", "r2", StructValue({}), std::nullopt, "u1");

  const auto all = queue->Pending();
  assert(all.size() == 3);
  assert(all[0].id() == first);
  assert(all[1].id() == second);
  assert(all[2].id() == third);

  const auto u1 = queue->Pending(std::string("u1"));
  assert(u1.size() == 2);
  assert(u1[0].id() == first);
  assert(u1[1].id() == third);

  const auto op = queue->Get(first);
  assert(op.has_value());
  assert(op->status() == OPERATION_STATUS_PENDING);
  assert(op->retry_count() == 0);
  assert(op->max_retries() == 3);
  assert(op->payload().struct_value().fields().at("title").string_value() == "A");
}

void TestRetryThenFailure() {
  auto       queue = MakeQueue();
  const auto id    = queue->Enqueue(OPERATION_KIND_UPDATE, "profile", "u1", StructValue({}), 3, "u1");

  queue->MarkProcessing(id);
  assert(queue->Get(id)->status() == OPERATION_STATUS_PROCESSING);

  queue->MarkFailed(id, 1);
  auto op = queue->Get(id);
  assert(op->status() == OPERATION_STATUS_PENDING);
  assert(op->retry_count() == 1);

  queue->MarkFailed(id, 3);
  op = queue->Get(id);
  assert(op->status() == OPERATION_STATUS_FAILED);
  assert(op->retry_count() == 3);

  assert(queue->Pending().empty());
  assert(queue->Failed().size() == 1);
}

void TestExplicitRetryLimitOverridesStoredOne() {
  auto       queue = MakeQueue();
  const auto id    = queue->Enqueue(OPERATION_KIND_CREATE, "resource", "r1", StructValue({}), 5, "u1");

  queue->MarkFailed(id, 2, 2u);
  assert(queue->Get(id)->status() == OPERATION_STATUS_FAILED);
}

void TestTerminalOperationsDoNotMove() {
  auto       queue = MakeQueue();
  const auto id    = queue->Enqueue(OPERATION_KIND_CREATE, "resource", "r1", StructValue({}), std::nullopt, "u1");

  assert(queue->MarkProcessing(id));
  assert(!queue->MarkProcessing(id));
  assert(queue->Get(id)->status() == OPERATION_STATUS_PROCESSING);

  assert(queue->MarkCompleted(id));
  assert(!queue->MarkProcessing(id));
  assert(!queue->MarkFailed(id, 1));
  auto op = queue->Get(id);
  assert(op->status() == OPERATION_STATUS_COMPLETED);
  assert(op->retry_count() == 0);

  // unknown ids are ignored
  assert(!queue->MarkProcessing("no-such-operation"));
  assert(!queue->MarkCompleted("no-such-operation"));
  assert(!queue->MarkFailed("no-such-operation", 1));
}

void TestUnserializablePayloadIsNotQueued() {
  auto queue = MakeQueue();

  google::protobuf::Value deep = StringValue("leaf");
  for (int i = 0; i < 70; ++i) {
    deep = StructValue({{"child", deep}});
  }

  bool threw = false;
  try {
    queue->Enqueue(OPERATION_KIND_CREATE, "resource", "r1", deep, std::nullopt, "u1");
  } catch (const offline::util::SerializationError&) {
    threw = true;
  }
  assert(threw);
  assert(queue->Stats().pending() == 0);
  assert(queue->Pending().empty());
}

void TestRecoverInterrupted() {
  auto       queue = MakeQueue();
  const auto a     = queue->Enqueue(OPERATION_KIND_CREATE, "resource", "a", StructValue({}), std::nullopt, "u1");
  const auto b     = queue->Enqueue(OPERATION_KIND_CREATE, "resource", "b", StructValue({}), std::nullopt, "u1");

  queue->MarkProcessing(a);
  queue->MarkProcessing(b);
  assert(queue->Stats().processing() == 2);

  assert(queue->RecoverInterrupted() == 2);
  auto stats = queue->Stats();
  assert(stats.processing() == 0);
  assert(stats.pending() == 2);
  assert(queue->RecoverInterrupted() == 0);
}

void TestEntityWrappersAndStats() {
  auto queue = MakeQueue();

  const auto profile = queue->EnqueueProfile("u7", StructValue({{"name", StringValue("Ada")}}));
  queue->EnqueueResource(OPERATION_KIND_CREATE, "r1", StructValue({}), "u7");
  queue->EnqueueMessage(OPERATION_KIND_CREATE, "m1", StructValue({}), "u7");
  const auto community = queue->EnqueueCommunity(OPERATION_KIND_UPDATE, "c1", StructValue({{"n", NumberValue(1)}}), "u8");

  auto op = queue->Get(profile);
  assert(op->kind() == OPERATION_KIND_UPDATE);
  assert(op->entity_type() == "profile");
  assert(op->entity_id() == "u7");
  assert(op->owner_id() == "u7");

  assert(queue->ByEntity("resource").size() == 1);
  assert(queue->ByEntity("community", std::string("u8")).size() == 1);
  assert(queue->ByEntity("community", std::string("u7")).empty());

  queue->MarkCompleted(community);
  queue->Remove(profile);
  assert(!queue->Get(profile).has_value());

  auto stats = queue->Stats();
  assert(stats.pending() == 2);
  assert(stats.completed() == 1);
  assert(stats.failed() == 0);
}

void TestUnreachableStoreDegradesReadsButNotWrites() {
  auto           repo = std::make_shared<offline::testing::FailingRepository>();
  OperationQueue queue(repo, OperationQueue::Options{});

  queue.EnqueueResource(OPERATION_KIND_CREATE, "r1", StructValue({}), "u1");

  repo->fail_reads = true;
  assert(queue.Pending().empty());
  assert(queue.Pending(std::string("u1")).empty());
  assert(queue.ByEntity("resource", std::string("u1")).empty());

  repo->fail_reads  = false;
  repo->fail_writes = true;
  bool threw = false;
  try {
    queue.EnqueueResource(OPERATION_KIND_CREATE, "r2", StructValue({}), "u1");
  } catch (const offline::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  repo->fail_writes = false;
  const auto pending = queue.Pending();
  assert(pending.size() == 1);
  assert(pending[0].entity_id() == "r1");
}

void TestUnreadableRowIsSkipped() {
  auto           repo = std::make_shared<offline::db::memory::MemoryRepository>();
  OperationQueue queue(repo, OperationQueue::Options{});

  offline::db::model::OperationRecord corrupt;
  corrupt.id            = "corrupt";
  corrupt.kind          = OPERATION_KIND_UPDATE;
  corrupt.entity_type   = "resource";
  corrupt.entity_id     = "r0";
  corrupt.payload_json  = "{\"title\":";
  corrupt.created_at_ms = 1;
  corrupt.max_retries   = 3;
  corrupt.status        = OPERATION_STATUS_PENDING;
  corrupt.owner_id      = "u1";
  {
    auto tx = repo->Begin();
    assert(repo->InsertOperation(*tx, corrupt));
    tx->Commit();
  }

  const auto id = queue.EnqueueResource(OPERATION_KIND_CREATE, "r1", StructValue({}), "u1");

  const auto pending = queue.Pending();
  assert(pending.size() == 1);
  assert(pending[0].id() == id);
  assert(queue.Stats().pending() == 2);
}

} // namespace

int main() {
  TestPendingIsOldestFirstAndFilteredByOwner();
  TestRetryThenFailure();
  TestExplicitRetryLimitOverridesStoredOne();
  TestTerminalOperationsDoNotMove();
  TestUnserializablePayloadIsNotQueued();
  TestRecoverInterrupted();
  TestEntityWrappersAndStats();
  TestUnreachableStoreDegradesReadsButNotWrites();
  TestUnreadableRowIsSkipped();

  std::cout << "offline_sync_unit_operation_queue: pass\n";
  return 0;
}
