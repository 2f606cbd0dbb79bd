#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "offline/v1/types.pb.h"

namespace offline::db {

/*
  Conversions between repository rows and the public protobuf types.
  Payload columns hold JSON; decoding a damaged column throws
  util::SerializationError.
*/

offline::v1::Operation  ToOperation(const model::OperationRecord& record);
model::OperationRecord  ToOperationRecord(const offline::v1::Operation& op);

offline::v1::ConflictRecord ToConflict(const model::ConflictRecord& record);
model::ConflictRecord       ToConflictRecord(const offline::v1::ConflictRecord& conflict);

// NotFound -> util::NotFound, everything else -> util::StorageError.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace offline::db
