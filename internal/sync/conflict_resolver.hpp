#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "offline/v1/types.pb.h"

namespace offline::sync {

/*
  Deterministic conflict policy.

    delete + remote data   -> delete conflict: MANUAL if remote is strictly
                              newer, else LOCAL_WINS
    create + remote data   -> create conflict: REMOTE_WINS
    otherwise              -> update conflict: MERGE when no shared field
                              differs (timestamps ignored), else REMOTE_WINS
                              when remote is newer, else LOCAL_WINS

  "Newer" compares lastModified / updatedAt (epoch ms or RFC3339), 0 when
  absent. MERGE records carry the merged document.
*/

constexpr const char* kSystemResolver = "system";

// Classification and policy only; nothing is persisted.
offline::v1::ConflictType ClassifyConflict(const offline::v1::Operation& local,
                                           const std::optional<google::protobuf::Value>& remote);

offline::v1::Resolution DecideResolution(offline::v1::ConflictType type, const google::protobuf::Value& local,
                                         const google::protobuf::Value& remote);

// Remote fields overlaid with local ones; timestamps take the newer side.
google::protobuf::Value MergeVersions(const google::protobuf::Value& local, const google::protobuf::Value& remote);

// Epoch ms of lastModified/updatedAt, 0 when missing or unparseable.
int64_t LastModifiedMillis(const google::protobuf::Value& version);

class ConflictResolver {
 public:
  explicit ConflictResolver(std::shared_ptr<db::Repository> repository);

  // Decides and persists. Throws util::StorageError when the record
  // cannot be written.
  offline::v1::ConflictRecord Resolve(const offline::v1::Operation& local, const google::protobuf::Value& remote);

  std::vector<offline::v1::ConflictRecord> ListConflicts(const std::optional<std::string>& entity_type = std::nullopt,
                                                         const std::optional<std::string>& entity_id   = std::nullopt);

  std::vector<offline::v1::ConflictRecord> Unresolved();

  std::optional<offline::v1::ConflictRecord> Get(const std::string& id);

  // Settles a MANUAL record. Throws util::NotFound for unknown or already
  // resolved ids and std::invalid_argument for MANUAL/unspecified.
  offline::v1::ConflictRecord ResolveManually(const std::string& id, offline::v1::Resolution resolution,
                                              const std::string& resolved_by);

 private:
  std::vector<offline::v1::ConflictRecord> Scan(const db::ConflictQuery& query);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace offline::sync
