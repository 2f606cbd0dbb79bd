#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace offline::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      OFFLINE_LOG_ERROR("SQLite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace offline::db::sqlite
