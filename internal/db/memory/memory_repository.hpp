#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace elevator::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertElevator(Transaction&, const model::ElevatorRecord&) override;
  std::optional<model::ElevatorRecord> GetElevator(Transaction&, const std::string&) override;
  std::vector<model::ElevatorRecord> ListElevators(Transaction&) override;
  Result UpdateElevator(Transaction&, const model::ElevatorRecord&) override;

  Result AppendEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::optional<std::string>& elevator_id,
                                             uint32_t limit) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ElevatorRecord> elevators;
    std::vector<model::EventRecord> events;
  };

  std::mutex mutex_;
  State committed_;
};

} // namespace elevator::db::memory
