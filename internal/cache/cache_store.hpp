#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "offline/v1/types.pb.h"

namespace offline::cache {

/*
  Durable key/value cache with TTL, priority classes and a byte quota.

  Quota usage counts cached values and entity snapshots. A write that
  finds the quota critical first runs housekeeping and, if still critical,
  evicts low -> medium -> high priority entries, least recently read
  first, until usage drops to eviction_target_ratio of the maximum.

  Reads never surface errors: expiry, storage failures and undecodable
  rows all read as a miss.
*/
class CacheStore {
 public:
  struct Options {
    uint64_t max_bytes             = 50ull * 1024ull * 1024ull;
    double   eviction_target_ratio = 0.8;

    // SetWithDefaultTtl
    std::chrono::milliseconds high_ttl   = std::chrono::hours(24);
    std::chrono::milliseconds medium_ttl = std::chrono::hours(12);
    std::chrono::milliseconds low_ttl    = std::chrono::hours(6);
  };

  CacheStore(std::shared_ptr<db::Repository> repository, Options options);

  // Overwrites any existing entry. Throws util::SerializationError for
  // values JSON cannot carry and util::StorageError when the write fails.
  void Set(const std::string& key, const google::protobuf::Value& value,
           offline::v1::CachePriority priority = offline::v1::CACHE_PRIORITY_MEDIUM,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  void SetWithDefaultTtl(const std::string& key, const google::protobuf::Value& value,
                         offline::v1::CachePriority priority);

  std::optional<google::protobuf::Value> Get(const std::string& key);

  // No-op when the key is absent.
  void Delete(const std::string& key);

  offline::v1::StorageQuota Quota();
  offline::v1::CacheStats   Stats();

  // Returns the number of entries evicted.
  uint64_t Evict();

  // Entity snapshots (kind, id). Counted against the quota.
  void PutSnapshot(const std::string& kind, const std::string& id, const std::string& owner_id,
                   const google::protobuf::Value& value);
  std::optional<google::protobuf::Value> GetSnapshot(const std::string& kind, const std::string& id);
  void                                   DeleteSnapshot(const std::string& kind, const std::string& id);

  // Most recently updated first.
  std::vector<google::protobuf::Value> ListSnapshots(const std::string& kind,
                                                     const std::optional<std::string>& owner_id = std::nullopt);

  const Options& GetOptions() const {
    return options_;
  }

 private:
  std::chrono::milliseconds DefaultTtl(offline::v1::CachePriority priority) const;

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
};

} // namespace offline::cache
