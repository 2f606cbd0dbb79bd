#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "offline/v1/types.pb.h"

namespace offline::db::model {

struct CacheEntryRecord {
  std::string key;

  // serialized value; size_bytes is its length
  std::string value_json;

  offline::v1::CachePriority priority = offline::v1::CACHE_PRIORITY_MEDIUM;

  uint64_t created_at_ms = 0;

  // nullopt = no TTL
  std::optional<uint64_t> expires_at_ms;

  uint64_t size_bytes = 0;

  uint64_t access_count        = 0;
  uint64_t last_accessed_at_ms = 0;
};

} // namespace offline::db::model
