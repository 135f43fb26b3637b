#include "memory_tx.hpp"

#include <stdexcept>

namespace elevator::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [id, record] : writes_.inserted) {
    if (repo_.committed_.elevators.contains(id)) {
      throw std::runtime_error("transaction conflict: elevator " + id + " was inserted by a concurrent transaction");
    }
  }

  for (auto& [id, record] : writes_.inserted) {
    repo_.committed_.elevators[id] = std::move(record);
  }
  for (auto& [id, record] : writes_.updated) {
    repo_.committed_.elevators[id] = std::move(record);
  }
  for (auto& event : writes_.events) {
    repo_.committed_.events.push_back(std::move(event));
  }

  writes_    = {};
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (committed_) return;
  writes_      = {};
  rolled_back_ = true;
}

} // namespace elevator::db::memory
