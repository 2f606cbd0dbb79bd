#include "housekeeping.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace offline::db {

using offline::observability::IntField;

namespace {

uint64_t Require(const Result& r, const char* what) {
  if (!r) {
    throw util::StorageError(std::string("housekeeping ") + what + ": " + ToString(r.code) + " " + r.message);
  }
  return r.rows_affected;
}

} // namespace

offline::v1::HousekeepingReport RunHousekeeping(Repository& repo, uint64_t now_ms) {
  offline::v1::HousekeepingReport report;

  auto tx = repo.Begin();

  report.set_expired_cache_entries(Require(repo.DeleteExpiredCacheEntries(*tx, now_ms), "expired cache"));

  report.set_completed_operations(Require(
      repo.DeleteOperationsCreatedBefore(*tx, offline::v1::OPERATION_STATUS_COMPLETED,
                                         util::MillisAgo(now_ms, kCompletedOperationRetentionMs)),
      "completed operations"));

  report.set_failed_operations(Require(
      repo.DeleteOperationsCreatedBefore(*tx, offline::v1::OPERATION_STATUS_FAILED,
                                         util::MillisAgo(now_ms, kFailedOperationRetentionMs)),
      "failed operations"));

  tx->Commit();

  OFFLINE_LOG_INFO("Housekeeping completed", {IntField("expired_cache_entries", report.expired_cache_entries()),
                                              IntField("completed_operations", report.completed_operations()),
                                              IntField("failed_operations", report.failed_operations())});
  return report;
}

} // namespace offline::db
