#pragma once

#include <cstdint>
#include <string>

namespace offline::db::model {

/*
  Last known copy of a domain entity kept for offline use
  (downloaded resources, offline messages, ...).

  Keyed by (kind, id). Counted against the storage quota.
*/

struct SnapshotRecord {
  std::string kind;
  std::string id;

  std::string owner_id;

  std::string json;
  uint64_t    size_bytes = 0;

  uint64_t updated_at_ms = 0;
};

} // namespace offline::db::model
