#include "record_codec.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace offline::db {

using namespace offline::v1;

Operation ToOperation(const model::OperationRecord& record) {
  Operation op;
  op.set_id(record.id);
  op.set_kind(record.kind);
  op.set_entity_type(record.entity_type);
  op.set_entity_id(record.entity_id);
  *op.mutable_payload() = util::FromJson(record.payload_json);
  op.set_created_at_ms(record.created_at_ms);
  op.set_retry_count(record.retry_count);
  op.set_max_retries(record.max_retries);
  op.set_status(record.status);
  op.set_owner_id(record.owner_id);
  return op;
}

model::OperationRecord ToOperationRecord(const Operation& op) {
  model::OperationRecord record;
  record.id            = op.id();
  record.kind          = op.kind();
  record.entity_type   = op.entity_type();
  record.entity_id     = op.entity_id();
  record.payload_json  = util::ToJson(op.payload());
  record.created_at_ms = op.created_at_ms();
  record.retry_count   = op.retry_count();
  record.max_retries   = op.max_retries();
  record.status        = op.status();
  record.owner_id      = op.owner_id();
  return record;
}

ConflictRecord ToConflict(const model::ConflictRecord& record) {
  ConflictRecord conflict;
  conflict.set_id(record.id);
  conflict.set_entity_type(record.entity_type);
  conflict.set_entity_id(record.entity_id);
  *conflict.mutable_local_version()  = util::FromJson(record.local_json);
  *conflict.mutable_remote_version() = util::FromJson(record.remote_json);
  if (!record.merged_json.empty()) {
    *conflict.mutable_merged_version() = util::FromJson(record.merged_json);
  }
  conflict.set_conflict_type(record.conflict_type);
  conflict.set_resolution(record.resolution);
  conflict.set_resolved_at_ms(record.resolved_at_ms.value_or(0));
  conflict.set_resolved_by(record.resolved_by);
  conflict.set_created_at_ms(record.created_at_ms);
  return conflict;
}

model::ConflictRecord ToConflictRecord(const ConflictRecord& conflict) {
  model::ConflictRecord record;
  record.id          = conflict.id();
  record.entity_type = conflict.entity_type();
  record.entity_id   = conflict.entity_id();
  record.local_json  = util::ToJson(conflict.local_version());
  record.remote_json = util::ToJson(conflict.remote_version());
  if (conflict.has_merged_version()) {
    record.merged_json = util::ToJson(conflict.merged_version());
  }
  record.conflict_type = conflict.conflict_type();
  record.resolution    = conflict.resolution();
  if (conflict.resolved_at_ms() != 0) {
    record.resolved_at_ms = conflict.resolved_at_ms();
  }
  record.resolved_by   = conflict.resolved_by();
  record.created_at_ms = conflict.created_at_ms();
  return record;
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageError(message + " (" + ToString(result.code) + ")");
  }
}

} // namespace offline::db
