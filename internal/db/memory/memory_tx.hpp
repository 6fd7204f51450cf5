#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace workflow::db::memory {

/*
  Transaction = exclusive store lock + snapshot copy.

  The lock is held from construction until Commit()/Rollback(), which
  serializes transactions the way BEGIN IMMEDIATE does for SQLite and
  makes every row lock trivially exclusive. Writes go to the working
  copy and replace the committed state on Commit().
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

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

} // namespace workflow::db::memory
