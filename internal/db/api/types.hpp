#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "offline/v1/types.pb.h"

namespace offline::db {

/*
  Scan predicates. Every set field must match; unset fields are ignored.
*/

// Ordered by created_at_ms ascending, then id.
struct OperationQuery {
  std::optional<offline::v1::OperationStatus> status;
  std::optional<std::string>                  owner_id;
  std::optional<std::string>                  entity_type;
  std::optional<std::string>                  entity_id;

  // strict bounds on created_at_ms
  std::optional<uint64_t> created_after_ms;
  std::optional<uint64_t> created_before_ms;

  std::optional<std::size_t> limit;
};

enum class CacheOrder {
  kKey,
  // priority low first, then oldest last_accessed first
  kEviction,
};

struct CacheQuery {
  std::optional<offline::v1::CachePriority> priority;

  // entries with expires_at_ms <= this value
  std::optional<uint64_t> expires_at_or_before_ms;

  CacheOrder                 order = CacheOrder::kKey;
  std::optional<std::size_t> limit;
};

struct CacheUsage {
  uint64_t bytes = 0;
  uint64_t count = 0;
};

// Ordered by created_at_ms ascending, then id.
struct ConflictQuery {
  std::optional<std::string> entity_type;
  std::optional<std::string> entity_id;
  bool                       unresolved_only = false;

  std::optional<std::size_t> limit;
};

// Ordered by updated_at_ms descending, then id.
struct SnapshotQuery {
  std::string                kind;
  std::optional<std::string> owner_id;
  std::optional<std::size_t> limit;
};

} // namespace offline::db
