#include "internal/sync/conflict_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace offline::v1;
using namespace offline::sync;
using google::protobuf::Value;
using offline::util::Field;
using offline::util::NullValue;
using offline::util::NumberValue;
using offline::util::StringValue;
using offline::util::StructValue;

Operation MakeOp(OperationKind kind, const Value& payload) {
  Operation op;
  op.set_id("op-1");
  op.set_kind(kind);
  op.set_entity_type("resource");
  op.set_entity_id("r1");
  *op.mutable_payload() = payload;
  op.set_owner_id("u1");
  return op;
}

void TestClassification() {
  const auto remote = StructValue({{"title", StringValue("remote")}});

  assert(ClassifyConflict(MakeOp(OPERATION_KIND_DELETE, StructValue({})), remote) == CONFLICT_TYPE_DELETE);
  assert(ClassifyConflict(MakeOp(OPERATION_KIND_CREATE, StructValue({})), remote) == CONFLICT_TYPE_CREATE);
  assert(ClassifyConflict(MakeOp(OPERATION_KIND_UPDATE, StructValue({})), remote) == CONFLICT_TYPE_UPDATE);

  // no remote data: nothing to delete or duplicate
  assert(ClassifyConflict(MakeOp(OPERATION_KIND_DELETE, StructValue({})), NullValue()) == CONFLICT_TYPE_UPDATE);
  assert(ClassifyConflict(MakeOp(OPERATION_KIND_CREATE, StructValue({})), std::nullopt) == CONFLICT_TYPE_UPDATE);
}

void TestTimestamps() {
  assert(LastModifiedMillis(StructValue({{"lastModified", NumberValue(1500)}})) == 1500);
  assert(LastModifiedMillis(StructValue({{"updatedAt", StringValue("2024-01-01T00:00:00Z")}})) == 1704067200000);
  assert(LastModifiedMillis(StructValue({{"lastModified", NumberValue(0)}, {"updatedAt", NumberValue(42)}})) == 42);
  assert(LastModifiedMillis(StructValue({{"lastModified", StringValue("")}, {"updatedAt", NumberValue(7)}})) == 7);
  assert(LastModifiedMillis(StructValue({{"lastModified", StringValue("yesterday")}})) == 0);
  assert(LastModifiedMillis(StructValue({})) == 0);
  assert(LastModifiedMillis(StringValue("not a struct")) == 0);
}

void TestPolicy() {
  const auto older = StructValue({{"title", StringValue("a")}, {"lastModified", NumberValue(100)}});
  const auto newer = StructValue({{"title", StringValue("b")}, {"lastModified", NumberValue(200)}});

  assert(DecideResolution(CONFLICT_TYPE_CREATE, newer, older) == RESOLUTION_REMOTE_WINS);

  assert(DecideResolution(CONFLICT_TYPE_DELETE, older, newer) == RESOLUTION_MANUAL);
  assert(DecideResolution(CONFLICT_TYPE_DELETE, newer, older) == RESOLUTION_LOCAL_WINS);
  assert(DecideResolution(CONFLICT_TYPE_DELETE, older, older) == RESOLUTION_LOCAL_WINS);

  assert(DecideResolution(CONFLICT_TYPE_UPDATE, older, newer) == RESOLUTION_REMOTE_WINS);
  assert(DecideResolution(CONFLICT_TYPE_UPDATE, newer, older) == RESOLUTION_LOCAL_WINS);

  // timestamps alone never block a merge
  const auto local  = StructValue({{"title", StringValue("a")}, {"lastModified", NumberValue(100)}});
  const auto remote = StructValue({{"tags", StringValue("x")}, {"title", StringValue("a")}, {"lastModified", NumberValue(300)}});
  assert(DecideResolution(CONFLICT_TYPE_UPDATE, local, remote) == RESOLUTION_MERGE);

  // nested difference blocks the merge
  const auto nested_local  = StructValue({{"meta", StructValue({{"k", NumberValue(1)}})}});
  const auto nested_remote = StructValue({{"meta", StructValue({{"k", NumberValue(2)}})}});
  assert(DecideResolution(CONFLICT_TYPE_UPDATE, nested_local, nested_remote) == RESOLUTION_LOCAL_WINS);

  // non-struct versions never merge
  assert(DecideResolution(CONFLICT_TYPE_UPDATE, StringValue("a"), StringValue("a")) == RESOLUTION_LOCAL_WINS);
}

void TestMergeVersions() {
  const auto local  = StructValue({{"title", StringValue("local")}, {"body", StringValue("text")}, {"lastModified", NumberValue(100)}});
  const auto remote = StructValue({{"title", StringValue("remote")}, {"tags", StringValue("x")}, {"lastModified", NumberValue(300)}});

  const auto merged = MergeVersions(local, remote);
  assert(Field(merged, "title")->string_value() == "local");
  assert(Field(merged, "body")->string_value() == "text");
  assert(Field(merged, "tags")->string_value() == "x");
  assert(Field(merged, "lastModified")->number_value() == 300);
}

void TestResolvePersistsRecords() {
  auto             repo = std::make_shared<offline::db::memory::MemoryRepository>();
  ConflictResolver resolver(repo);

  const auto local  = StructValue({{"title", StringValue("a")}, {"lastModified", NumberValue(100)}});
  const auto remote = StructValue({{"extra", StringValue("b")}, {"lastModified", NumberValue(50)}});

  auto merged = resolver.Resolve(MakeOp(OPERATION_KIND_UPDATE, local), remote);
  assert(merged.resolution() == RESOLUTION_MERGE);
  assert(merged.resolved_by() == kSystemResolver);
  assert(merged.resolved_at_ms() != 0);
  assert(Field(merged.merged_version(), "extra")->string_value() == "b");
  assert(Field(merged.merged_version(), "title")->string_value() == "a");

  const auto deleted_remote = StructValue({{"lastModified", NumberValue(500)}});
  auto manual = resolver.Resolve(MakeOp(OPERATION_KIND_DELETE, local), deleted_remote);
  assert(manual.resolution() == RESOLUTION_MANUAL);
  assert(manual.resolved_at_ms() == 0);
  assert(manual.resolved_by().empty());

  auto stored = resolver.Get(merged.id());
  assert(stored.has_value());
  assert(offline::util::Equal(stored->local_version(), local));
  assert(offline::util::Equal(stored->remote_version(), remote));
  assert(offline::util::Equal(stored->merged_version(), merged.merged_version()));

  assert(resolver.ListConflicts().size() == 2);
  assert(resolver.ListConflicts(std::string("resource"), std::string("r1")).size() == 2);
  assert(resolver.ListConflicts(std::string("message")).empty());

  auto open = resolver.Unresolved();
  assert(open.size() == 1);
  assert(open[0].id() == manual.id());
}

void TestManualResolution() {
  auto             repo = std::make_shared<offline::db::memory::MemoryRepository>();
  ConflictResolver resolver(repo);

  auto manual = resolver.Resolve(MakeOp(OPERATION_KIND_DELETE, StructValue({{"lastModified", NumberValue(1)}})),
                                 StructValue({{"lastModified", NumberValue(2)}}));
  assert(manual.resolution() == RESOLUTION_MANUAL);

  bool threw = false;
  try {
    resolver.ResolveManually(manual.id(), RESOLUTION_MANUAL, "ada");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto settled = resolver.ResolveManually(manual.id(), RESOLUTION_REMOTE_WINS, "ada");
  assert(settled.resolution() == RESOLUTION_REMOTE_WINS);
  assert(settled.resolved_by() == "ada");
  assert(settled.resolved_at_ms() != 0);
  assert(resolver.Unresolved().empty());
  assert(resolver.Get(manual.id())->resolved_by() == "ada");

  threw = false;
  try {
    resolver.ResolveManually(manual.id(), RESOLUTION_LOCAL_WINS, "ada");
  } catch (const offline::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    resolver.ResolveManually("no-such-conflict", RESOLUTION_LOCAL_WINS, "ada");
  } catch (const offline::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestManualMergeCarriesMergedVersion() {
  auto             repo = std::make_shared<offline::db::memory::MemoryRepository>();
  ConflictResolver resolver(repo);

  auto manual = resolver.Resolve(
      MakeOp(OPERATION_KIND_DELETE, StructValue({{"title", StringValue("local")}, {"lastModified", NumberValue(1)}})),
      StructValue({{"body", StringValue("remote")}, {"lastModified", NumberValue(2)}}));
  assert(manual.resolution() == RESOLUTION_MANUAL);
  assert(!manual.has_merged_version());

  auto settled = resolver.ResolveManually(manual.id(), RESOLUTION_MERGE, "ada");
  assert(settled.resolution() == RESOLUTION_MERGE);
  assert(settled.has_merged_version());
  assert(Field(settled.merged_version(), "title")->string_value() == "local");
  assert(Field(settled.merged_version(), "body")->string_value() == "remote");
  assert(Field(settled.merged_version(), "lastModified")->number_value() == 2);

  auto stored = resolver.Get(manual.id());
  assert(stored->has_merged_version());
  assert(offline::util::Equal(stored->merged_version(), settled.merged_version()));
}

} // namespace

int main() {
  TestClassification();
  TestTimestamps();
  TestPolicy();
  TestMergeVersions();
  TestResolvePersistsRecords();
  TestManualResolution();
  TestManualMergeCarriesMergedVersion();

  std::cout << "offline_sync_unit_conflict_resolver: pass\n";
  return 0;
}
