#include "memory_tx.hpp"

#include <stdexcept>

namespace netorch::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_.deployments = repo_.committed_.deployments;
  working_.nodes       = repo_.committed_.nodes;
  working_.events      = repo_.committed_.events;
  // telemetry only grows; working_.telemetry holds this transaction's own
  // samples and reads merge in the committed table
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

Result MemoryTransaction::Apply(MemoryRepository::Mutation mutation) {
  if (committed_ || rolled_back_) {
    return Result::Err(ErrorCode::InternalError, "transaction already finished");
  }

  MemoryRepository::UndoLog undo;
  auto                      result = mutation(working_, undo);
  if (result) {
    log_.push_back(std::move(mutation));
  } else {
    for (auto it = undo.rbegin(); it != undo.rend(); ++it) (*it)(working_);
  }
  return result;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }

  std::scoped_lock          lock(repo_.mutex_);
  MemoryRepository::UndoLog undo;
  for (auto& mutation : log_) {
    auto result = mutation(repo_.committed_, undo);
    if (!result) {
      for (auto it = undo.rbegin(); it != undo.rend(); ++it) (*it)(repo_.committed_);
      throw std::runtime_error("transaction conflict: " + result.message);
    }
  }
  log_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  log_.clear();
  rolled_back_ = true;
}

} // namespace netorch::db::memory
