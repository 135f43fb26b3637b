#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/core/building_config_store.hpp"
#include "internal/core/movement_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/building_config.hpp"
#include "internal/model/elevator.hpp"
#include "internal/model/event.hpp"
#include "internal/model/stop.hpp"

namespace elevator::core {

struct CallResult {
  std::string elevator_id;
  double      estimated_seconds = 0;
};

struct UnitStatus {
  model::Elevator          elevator;
  bool                     movement_active = false;
  std::vector<model::Stop> pending_stops;
};

/*
  Entry point for everything outside the engine: request handlers, the CLI
  and process bootstrap. Validation and lookups throw util exceptions.
*/
class ElevatorManager {
 public:
  static constexpr uint32_t kDefaultEventLimit = 100;
  static constexpr uint32_t kMaxEventLimit     = 1000;

  ElevatorManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<MovementEngine> engine, std::shared_ptr<BuildingConfigStore> config);

  CallResult AcceptCall(int from_floor, int to_floor, const std::string& requested_by = {});

  UnitStatus              CurrentState(const std::string& elevator_id);
  std::vector<UnitStatus> CurrentStates();

  // Newest first. limit 0 means kDefaultEventLimit; capped at kMaxEventLimit.
  std::vector<model::ElevatorEvent> ListEvents(const std::optional<std::string>& elevator_id, uint32_t limit = 0);

  std::size_t StopAll();

  model::BuildingConfig GetConfig() const;
  model::BuildingConfig SetConfig(const model::BuildingConfigUpdate& update);

  // Seeds an empty store with size idle units at floor 1, or settles units
  // left mid-journey by a previous process back to idle.
  void InitializeFleet(uint32_t size, const std::string& id_prefix);

 private:
  std::vector<model::Elevator> Fleet();
  UnitStatus                   StatusOf(model::Elevator elevator) const;

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<MovementEngine>      engine_;
  std::shared_ptr<BuildingConfigStore> config_;

  // Calls are validated and queued under a shared lock; SetConfig checks and
  // swaps the building under an exclusive one.
  std::shared_mutex config_guard_;
};

} // namespace elevator::core
