#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace streamgate::db::memory {

/*
  Transaction = repository lock + undo journal.

  The repository mutex is held from construction until Commit()/Rollback(),
  so every transaction sees and mutates the committed state directly and
  check-then-write sequences are serialized. Writers register the inverse
  of each mutation; Rollback() replays them newest first.

  Never open a second transaction on the same repository from the thread
  that already holds one.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Data() {
    return repo_.state_;
  }

  void OnRollback(std::function<void()> undo);

 private:
  MemoryRepository&                  repo_;
  std::unique_lock<std::mutex>       lock_;
  std::vector<std::function<void()>> undo_;
  bool                               finished_ = false;
};

} // namespace streamgate::db::memory
