#pragma once

#include <cstdint>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "offline/v1/types.pb.h"

namespace offline::db {

constexpr uint64_t kCompletedOperationRetentionMs = 7ull * util::kMillisPerDay;
constexpr uint64_t kFailedOperationRetentionMs    = 30ull * util::kMillisPerDay;

/*
  Cross-table cleanup, in one transaction:
    - cache entries with expires_at_ms <= now_ms
    - completed operations created more than 7 days before now_ms
    - failed operations created more than 30 days before now_ms

  Throws util::StorageError when any delete fails; nothing is removed then.
*/
offline::v1::HousekeepingReport RunHousekeeping(Repository& repo, uint64_t now_ms);

} // namespace offline::db
