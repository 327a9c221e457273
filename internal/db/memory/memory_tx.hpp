#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace songqueue::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }
  MemoryRepository::WriteSet& Writes() {
    return writes_;
  }

 private:
  MemoryRepository&          repo_;
  MemoryRepository::State    working_;
  MemoryRepository::WriteSet writes_;
  bool                       committed_   = false;
  bool                       rolled_back_ = false;
};

} // namespace songqueue::db::memory
