#include "conflict_resolver.hpp"

#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>

#include <cmath>
#include <stdexcept>

#include "internal/db/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace offline::sync {

using namespace offline::v1;
using google::protobuf::Value;
using offline::observability::StringField;

namespace {

constexpr const char* kLastModified = "lastModified";
constexpr const char* kUpdatedAt    = "updatedAt";

bool IsBookkeeping(const std::string& key) {
  return key == kLastModified || key == kUpdatedAt;
}

// JS-style truthiness: the first present, non-empty timestamp field wins.
bool IsSet(const std::optional<Value>& v) {
  if (!v) return false;
  switch (v->kind_case()) {
    case Value::kNumberValue:
      return v->number_value() != 0 && !std::isnan(v->number_value());
    case Value::kStringValue:
      return !v->string_value().empty();
    case Value::kBoolValue:
      return v->bool_value();
    case Value::kStructValue:
    case Value::kListValue:
      return true;
    default:
      return false;
  }
}

int64_t ParseMillis(const Value& v) {
  if (v.kind_case() == Value::kNumberValue) {
    const double ms = v.number_value();
    return std::isfinite(ms) ? static_cast<int64_t>(ms) : 0;
  }
  if (v.kind_case() == Value::kStringValue) {
    google::protobuf::Timestamp ts;
    if (google::protobuf::util::TimeUtil::FromString(v.string_value(), &ts)) {
      return google::protobuf::util::TimeUtil::TimestampToMilliseconds(ts);
    }
  }
  return 0;
}

bool RemoteIsNewer(const Value& local, const Value& remote) {
  return LastModifiedMillis(remote) > LastModifiedMillis(local);
}

bool CanAutoMerge(const Value& local, const Value& remote) {
  if (local.kind_case() != Value::kStructValue || remote.kind_case() != Value::kStructValue) {
    return false;
  }

  const auto& remote_fields = remote.struct_value().fields();
  for (const auto& [key, field] : local.struct_value().fields()) {
    if (IsBookkeeping(key)) continue;
    auto it = remote_fields.find(key);
    if (it != remote_fields.end() && !util::Equal(field, it->second)) {
      return false;
    }
  }
  return true;
}

const char* ResolutionName(Resolution resolution) {
  switch (resolution) {
    case RESOLUTION_LOCAL_WINS:
      return "local_wins";
    case RESOLUTION_REMOTE_WINS:
      return "remote_wins";
    case RESOLUTION_MERGE:
      return "merge";
    case RESOLUTION_MANUAL:
      return "manual";
    default:
      return "unspecified";
  }
}

} // namespace

int64_t LastModifiedMillis(const Value& version) {
  auto last_modified = util::Field(version, kLastModified);
  if (IsSet(last_modified)) return ParseMillis(*last_modified);

  auto updated_at = util::Field(version, kUpdatedAt);
  if (IsSet(updated_at)) return ParseMillis(*updated_at);

  return 0;
}

ConflictType ClassifyConflict(const Operation& local, const std::optional<Value>& remote) {
  const bool has_remote = remote && !util::IsNull(*remote);
  if (has_remote && local.kind() == OPERATION_KIND_DELETE) return CONFLICT_TYPE_DELETE;
  if (has_remote && local.kind() == OPERATION_KIND_CREATE) return CONFLICT_TYPE_CREATE;
  return CONFLICT_TYPE_UPDATE;
}

Resolution DecideResolution(ConflictType type, const Value& local, const Value& remote) {
  switch (type) {
    case CONFLICT_TYPE_CREATE:
      return RESOLUTION_REMOTE_WINS;

    case CONFLICT_TYPE_DELETE:
      return RemoteIsNewer(local, remote) ? RESOLUTION_MANUAL : RESOLUTION_LOCAL_WINS;

    case CONFLICT_TYPE_UPDATE:
      if (CanAutoMerge(local, remote)) return RESOLUTION_MERGE;
      return RemoteIsNewer(local, remote) ? RESOLUTION_REMOTE_WINS : RESOLUTION_LOCAL_WINS;

    default:
      return RESOLUTION_MANUAL;
  }
}

Value MergeVersions(const Value& local, const Value& remote) {
  if (local.kind_case() != Value::kStructValue || remote.kind_case() != Value::kStructValue) {
    return local;
  }

  Value merged = remote;
  auto* fields = merged.mutable_struct_value()->mutable_fields();
  for (const auto& [key, field] : local.struct_value().fields()) {
    if (IsBookkeeping(key)) continue;
    (*fields)[key] = field;
  }

  const Value& newer = RemoteIsNewer(local, remote) ? remote : local;
  for (const char* key : {kLastModified, kUpdatedAt}) {
    if (auto stamp = util::Field(newer, key)) {
      (*fields)[key] = *stamp;
    }
  }
  return merged;
}

ConflictResolver::ConflictResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("ConflictResolver requires a repository");
  }
}

ConflictRecord ConflictResolver::Resolve(const Operation& local, const Value& remote) {
  ConflictRecord conflict;
  conflict.set_id(util::NewId());
  conflict.set_entity_type(local.entity_type());
  conflict.set_entity_id(local.entity_id());
  *conflict.mutable_local_version()  = local.payload();
  *conflict.mutable_remote_version() = remote;
  conflict.set_conflict_type(ClassifyConflict(local, remote));
  conflict.set_resolution(DecideResolution(conflict.conflict_type(), local.payload(), remote));
  conflict.set_created_at_ms(util::NowMillis());

  if (conflict.resolution() == RESOLUTION_MERGE) {
    *conflict.mutable_merged_version() = MergeVersions(local.payload(), remote);
  }
  if (conflict.resolution() != RESOLUTION_MANUAL) {
    conflict.set_resolved_at_ms(conflict.created_at_ms());
    conflict.set_resolved_by(kSystemResolver);
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertConflict(*tx, db::ToConflictRecord(conflict)), "record conflict " + conflict.id());
  tx->Commit();

  OFFLINE_LOG_INFO("Conflict resolved", {StringField("conflict_id", conflict.id()), StringField("entity_type", conflict.entity_type()),
                                         StringField("entity_id", conflict.entity_id()),
                                         StringField("resolution", ResolutionName(conflict.resolution()))});
  return conflict;
}

std::vector<ConflictRecord> ConflictResolver::Scan(const db::ConflictQuery& query) {
  std::vector<ConflictRecord> out;

  auto tx     = repository_->Begin();
  auto cursor = repository_->ScanConflicts(*tx, query);
  while (auto record = cursor->Next()) {
    out.push_back(db::ToConflict(*record));
  }
  tx->Commit();
  return out;
}

std::vector<ConflictRecord> ConflictResolver::ListConflicts(const std::optional<std::string>& entity_type,
                                                            const std::optional<std::string>& entity_id) {
  db::ConflictQuery query;
  query.entity_type = entity_type;
  query.entity_id   = entity_id;
  return Scan(query);
}

std::vector<ConflictRecord> ConflictResolver::Unresolved() {
  db::ConflictQuery query;
  query.unresolved_only = true;
  return Scan(query);
}

std::optional<ConflictRecord> ConflictResolver::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetConflict(*tx, id);
  tx->Commit();

  if (!record) return std::nullopt;
  return db::ToConflict(*record);
}

ConflictRecord ConflictResolver::ResolveManually(const std::string& id, Resolution resolution,
                                                 const std::string& resolved_by) {
  if (resolution == RESOLUTION_MANUAL || resolution == RESOLUTION_UNSPECIFIED) {
    throw std::invalid_argument("manual resolution must pick local_wins, remote_wins or merge");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetConflict(*tx, id);
  if (!record || record->resolved_at_ms) {
    throw util::NotFound("unresolved conflict not found: " + id);
  }

  std::string merged_json;
  if (resolution == RESOLUTION_MERGE) {
    merged_json = util::ToJson(MergeVersions(util::FromJson(record->local_json), util::FromJson(record->remote_json)));
  }

  const uint64_t now = util::NowMillis();
  db::ThrowIfDbError(repository_->ResolveConflict(*tx, id, resolution, now, resolved_by, merged_json),
                     "resolve conflict " + id);
  tx->Commit();

  record->resolution     = resolution;
  record->resolved_at_ms = now;
  record->resolved_by    = resolved_by;
  record->merged_json    = merged_json;

  OFFLINE_LOG_INFO("Conflict resolved manually", {StringField("conflict_id", id), StringField("resolution", ResolutionName(resolution)),
                                                  StringField("resolved_by", resolved_by)});
  return db::ToConflict(*record);
}

} // namespace offline::sync
