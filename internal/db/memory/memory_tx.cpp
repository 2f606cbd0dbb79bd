#include "memory_tx.hpp"

namespace offline::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  finished_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  working_  = {};
  finished_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace offline::db::memory
