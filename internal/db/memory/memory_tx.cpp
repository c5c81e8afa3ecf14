#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace commute::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) throw util::StorageError("transaction already finished");
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  finished_ = true;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace commute::db::memory
