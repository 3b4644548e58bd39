#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace netorch::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot taken at Begin() plus this transaction's own writes.
  Commit() replays the log onto the latest committed state, so transactions
  touching different rows never conflict.

  Telemetry is append-only and is not part of the snapshot: telemetry reads
  see every committed sample (read committed) plus this transaction's own.
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

  Result Apply(MemoryRepository::Mutation mutation);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                      repo_;
  MemoryRepository::State                working_;
  std::vector<MemoryRepository::Mutation> log_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace netorch::db::memory
