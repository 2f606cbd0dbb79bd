#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "offline/v1/types.pb.h"

namespace offline::db::model {

/*
  Append-only conflict log row. Once resolved_at_ms is set the row never
  changes again.
*/

struct ConflictRecord {
  std::string id;

  std::string entity_type;
  std::string entity_id;

  std::string local_json;
  std::string remote_json;

  // empty unless resolution is MERGE
  std::string merged_json;

  offline::v1::ConflictType conflict_type = offline::v1::CONFLICT_TYPE_UNSPECIFIED;
  offline::v1::Resolution   resolution    = offline::v1::RESOLUTION_UNSPECIFIED;

  std::optional<uint64_t> resolved_at_ms;
  std::string             resolved_by;

  uint64_t created_at_ms = 0;
};

} // namespace offline::db::model
