#pragma once

#include <cstdint>
#include <string>

#include "offline/v1/types.pb.h"

namespace offline::db::model {

/*
  Persistent operation row.

  IMPORTANT:
  - Only status and retry_count change after insert.
  - payload_json is the opaque serialized mutation; the store never
    interprets it.
*/

struct OperationRecord {
  std::string id;

  offline::v1::OperationKind kind = offline::v1::OPERATION_KIND_UNSPECIFIED;

  std::string entity_type;
  std::string entity_id;

  std::string payload_json;

  // epoch ms, ordering key
  uint64_t created_at_ms = 0;

  uint32_t retry_count = 0;
  uint32_t max_retries = 0;

  offline::v1::OperationStatus status = offline::v1::OPERATION_STATUS_UNSPECIFIED;

  std::string owner_id;
};

} // namespace offline::db::model
