#include "memory_tx.hpp"

#include <stdexcept>

namespace streamgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("memory transaction already finished");
  }
  undo_.clear();
  finished_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)();
  }
  undo_.clear();
  finished_ = true;
  lock_.unlock();
}

void MemoryTransaction::OnRollback(std::function<void()> undo) {
  undo_.push_back(std::move(undo));
}

} // namespace streamgate::db::memory
