#include "operation_queue.hpp"

#include <stdexcept>

#include "internal/db/housekeeping.hpp"
#include "internal/db/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace offline::queue {

using namespace offline::v1;
using offline::observability::IntField;
using offline::observability::StringField;

namespace {

bool IsTerminal(OperationStatus status) {
  return status == OPERATION_STATUS_COMPLETED || status == OPERATION_STATUS_FAILED;
}

const char* StatusName(OperationStatus status) {
  switch (status) {
    case OPERATION_STATUS_PENDING:
      return "pending";
    case OPERATION_STATUS_PROCESSING:
      return "processing";
    case OPERATION_STATUS_COMPLETED:
      return "completed";
    case OPERATION_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace

OperationQueue::OperationQueue(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("OperationQueue requires a repository");
  }
}

std::string OperationQueue::Enqueue(OperationKind kind, const std::string& entity_type, const std::string& entity_id,
                                    const google::protobuf::Value& payload, std::optional<uint32_t> max_retries,
                                    const std::string& owner_id) {
  db::model::OperationRecord record;
  record.payload_json  = util::ToJson(payload);
  record.id            = util::NewId();
  record.kind          = kind;
  record.entity_type   = entity_type;
  record.entity_id     = entity_id;
  record.created_at_ms = util::NowMillis();
  record.retry_count   = 0;
  record.max_retries   = max_retries.value_or(options_.default_max_retries);
  record.status        = OPERATION_STATUS_PENDING;
  record.owner_id      = owner_id;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertOperation(*tx, record), "enqueue operation " + record.id);
  tx->Commit();

  OFFLINE_LOG_DEBUG("Operation enqueued", {StringField("operation_id", record.id), StringField("entity_type", entity_type),
                                           StringField("entity_id", entity_id), StringField("owner_id", owner_id)});
  return record.id;
}

std::string OperationQueue::EnqueueResource(OperationKind kind, const std::string& resource_id,
                                            const google::protobuf::Value& payload, const std::string& owner_id) {
  return Enqueue(kind, "resource", resource_id, payload, std::nullopt, owner_id);
}

std::string OperationQueue::EnqueueMessage(OperationKind kind, const std::string& message_id,
                                           const google::protobuf::Value& payload, const std::string& owner_id) {
  return Enqueue(kind, "message", message_id, payload, std::nullopt, owner_id);
}

std::string OperationQueue::EnqueueProfile(const std::string& user_id, const google::protobuf::Value& payload) {
  return Enqueue(OPERATION_KIND_UPDATE, "profile", user_id, payload, std::nullopt, user_id);
}

std::string OperationQueue::EnqueueCommunity(OperationKind kind, const std::string& community_id,
                                             const google::protobuf::Value& payload, const std::string& owner_id) {
  return Enqueue(kind, "community", community_id, payload, std::nullopt, owner_id);
}

std::optional<Operation> OperationQueue::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetOperation(*tx, id);
  tx->Commit();

  if (!record) return std::nullopt;
  return db::ToOperation(*record);
}

std::vector<Operation> OperationQueue::Query(const db::OperationQuery& query) {
  std::vector<Operation> out;
  try {
    auto tx     = repository_->Begin();
    auto cursor = repository_->ScanOperations(*tx, query);
    while (auto record = cursor->Next()) {
      try {
        out.push_back(db::ToOperation(*record));
      } catch (const util::SerializationError& e) {
        // one corrupt row must not hide the rest of the queue
        OFFLINE_LOG_ERROR("Skipping unreadable operation", {StringField("operation_id", record->id), StringField("error", e.what())});
      }
    }
    tx->Commit();
  } catch (const util::StorageError& e) {
    OFFLINE_LOG_WARN("Operation scan failed, returning no operations", {StringField("error", e.what())});
    out.clear();
  }
  return out;
}

std::vector<Operation> OperationQueue::Pending(const std::optional<std::string>& owner_id) {
  db::OperationQuery query;
  query.status   = OPERATION_STATUS_PENDING;
  query.owner_id = owner_id;
  return Query(query);
}

std::vector<Operation> OperationQueue::Failed(const std::optional<std::string>& owner_id) {
  db::OperationQuery query;
  query.status   = OPERATION_STATUS_FAILED;
  query.owner_id = owner_id;
  return Query(query);
}

std::vector<Operation> OperationQueue::ByEntity(const std::string& entity_type,
                                                const std::optional<std::string>& owner_id) {
  db::OperationQuery query;
  query.status      = OPERATION_STATUS_PENDING;
  query.owner_id    = owner_id;
  query.entity_type = entity_type;
  return Query(query);
}

bool OperationQueue::MarkProcessing(const std::string& id) {
  return Apply(id, Transition::kProcessing, 0, std::nullopt);
}

bool OperationQueue::MarkCompleted(const std::string& id) {
  return Apply(id, Transition::kCompleted, 0, std::nullopt);
}

bool OperationQueue::MarkFailed(const std::string& id, uint32_t new_retry_count, std::optional<uint32_t> max_retries) {
  return Apply(id, Transition::kFailed, new_retry_count, max_retries);
}

bool OperationQueue::Apply(const std::string& id, Transition transition, uint32_t new_retry_count,
                           std::optional<uint32_t> max_retries) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetOperation(*tx, id);
  if (!record) {
    tx->Rollback();
    OFFLINE_LOG_DEBUG("Transition on unknown operation ignored", {StringField("operation_id", id)});
    return false;
  }

  const auto from = record->status;
  if (IsTerminal(from) || (transition == Transition::kProcessing && from != OPERATION_STATUS_PENDING)) {
    tx->Rollback();
    OFFLINE_LOG_WARN("Operation transition ignored", {StringField("operation_id", id), StringField("status", StatusName(from))});
    return false;
  }

  OperationStatus to          = from;
  uint32_t        retry_count = record->retry_count;
  switch (transition) {
    case Transition::kProcessing:
      to = OPERATION_STATUS_PROCESSING;
      break;
    case Transition::kCompleted:
      to = OPERATION_STATUS_COMPLETED;
      break;
    case Transition::kFailed: {
      const uint32_t limit = max_retries.value_or(record->max_retries);
      retry_count          = new_retry_count;
      to                   = new_retry_count >= limit ? OPERATION_STATUS_FAILED : OPERATION_STATUS_PENDING;
      break;
    }
  }

  db::ThrowIfDbError(repository_->UpdateOperationStatus(*tx, id, to, retry_count), "update operation " + id);
  tx->Commit();

  OFFLINE_LOG_DEBUG("Operation transitioned", {StringField("operation_id", id), StringField("from", StatusName(from)),
                                               StringField("to", StatusName(to)), IntField("retry_count", retry_count)});
  if (to == OPERATION_STATUS_FAILED) {
    OFFLINE_LOG_WARN("Operation exhausted its retries", {StringField("operation_id", id), IntField("retry_count", retry_count)});
  }
  return true;
}

void OperationQueue::Remove(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteOperation(*tx, id), "remove operation " + id);
  tx->Commit();
}

QueueStats OperationQueue::Stats() {
  QueueStats stats;

  auto tx = repository_->Begin();
  stats.set_pending(repository_->CountOperations(*tx, OPERATION_STATUS_PENDING));
  stats.set_processing(repository_->CountOperations(*tx, OPERATION_STATUS_PROCESSING));
  stats.set_failed(repository_->CountOperations(*tx, OPERATION_STATUS_FAILED));
  stats.set_completed(repository_->CountOperations(*tx, OPERATION_STATUS_COMPLETED));
  tx->Commit();

  return stats;
}

uint64_t OperationQueue::RecoverInterrupted() {
  auto tx     = repository_->Begin();
  auto result = repository_->ResetOperationStatus(*tx, OPERATION_STATUS_PROCESSING, OPERATION_STATUS_PENDING);
  db::ThrowIfDbError(result, "recover interrupted operations");
  tx->Commit();

  if (result.rows_affected > 0) {
    OFFLINE_LOG_INFO("Recovered interrupted operations", {IntField("count", static_cast<int64_t>(result.rows_affected))});
  }
  return result.rows_affected;
}

HousekeepingReport OperationQueue::ClearOld() {
  return db::RunHousekeeping(*repository_, util::NowMillis());
}

} // namespace offline::queue
