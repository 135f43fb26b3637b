#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace elevator::db::memory {

/*
  Transaction = write set over the committed state.

  Reads merge the write set with the committed rows at read time; Commit()
  applies the write set under the repository lock. Two transactions that touch
  different elevators never conflict. Rows written by both are last-writer-wins;
  callers that need more serialize per elevator themselves.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  struct WriteSet {
    std::unordered_map<std::string, model::ElevatorRecord> inserted;
    std::unordered_map<std::string, model::ElevatorRecord> updated;
    std::vector<model::EventRecord>                        events;
  };

  WriteSet& Writes() {
    return writes_;
  }
  const WriteSet& Writes() const {
    return writes_;
  }

  MemoryRepository& Repo() {
    return repo_;
  }

 private:
  MemoryRepository& repo_;
  WriteSet          writes_;
  bool              committed_   = false;
  bool              rolled_back_ = false;
};

} // namespace elevator::db::memory
