#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "offline/v1/types.pb.h"

namespace offline::queue {

/*
  Durable FIFO of local mutations waiting to be pushed to the remote.

  State machine:
    pending -> processing -> completed                  (terminal)
    pending|processing -> pending  (retry_count < max)
    pending|processing -> failed   (retry_count >= max) (terminal)

  Transition calls on unknown ids or terminal operations are logged
  no-ops. Writes throw util::StorageError; list reads log storage failures
  and return an empty result.
*/
class OperationQueue {
 public:
  struct Options {
    uint32_t default_max_retries = 3;
  };

  OperationQueue(std::shared_ptr<db::Repository> repository, Options options);

  // Throws util::SerializationError before anything is persisted.
  std::string Enqueue(offline::v1::OperationKind kind, const std::string& entity_type, const std::string& entity_id,
                      const google::protobuf::Value& payload, std::optional<uint32_t> max_retries,
                      const std::string& owner_id);

  std::string EnqueueResource(offline::v1::OperationKind kind, const std::string& resource_id,
                              const google::protobuf::Value& payload, const std::string& owner_id);
  std::string EnqueueMessage(offline::v1::OperationKind kind, const std::string& message_id,
                             const google::protobuf::Value& payload, const std::string& owner_id);
  std::string EnqueueProfile(const std::string& user_id, const google::protobuf::Value& payload);
  std::string EnqueueCommunity(offline::v1::OperationKind kind, const std::string& community_id,
                               const google::protobuf::Value& payload, const std::string& owner_id);

  std::optional<offline::v1::Operation> Get(const std::string& id);

  // Oldest first.
  std::vector<offline::v1::Operation> Pending(const std::optional<std::string>& owner_id = std::nullopt);
  std::vector<offline::v1::Operation> Failed(const std::optional<std::string>& owner_id = std::nullopt);

  // Pending operations of one entity type.
  std::vector<offline::v1::Operation> ByEntity(const std::string& entity_type,
                                               const std::optional<std::string>& owner_id = std::nullopt);

  // Arbitrary filter over the operations table, oldest first.
  std::vector<offline::v1::Operation> Query(const db::OperationQuery& query);

  // Each returns true when the transition was applied. MarkProcessing
  // applies only to pending operations, so a false result means another
  // caller removed or claimed the operation first.
  bool MarkProcessing(const std::string& id);
  bool MarkCompleted(const std::string& id);
  bool MarkFailed(const std::string& id, uint32_t new_retry_count, std::optional<uint32_t> max_retries = std::nullopt);

  // Deletes regardless of status.
  void Remove(const std::string& id);

  offline::v1::QueueStats Stats();

  // processing -> pending for every operation; run once at startup.
  uint64_t RecoverInterrupted();

  // Age-based cleanup of completed/failed operations and expired cache entries.
  offline::v1::HousekeepingReport ClearOld();

  uint32_t DefaultMaxRetries() const {
    return options_.default_max_retries;
  }

 private:
  enum class Transition { kProcessing, kCompleted, kFailed };

  bool Apply(const std::string& id, Transition transition, uint32_t new_retry_count,
             std::optional<uint32_t> max_retries);

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
};

} // namespace offline::queue
