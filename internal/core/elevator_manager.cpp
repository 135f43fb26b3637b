#include "elevator_manager.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

#include "internal/core/dispatch_selector.hpp"
#include "internal/core/elevator_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace elevator::core {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;
using observability::UnitField;

ElevatorManager::ElevatorManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<MovementEngine> engine,
                                 std::shared_ptr<BuildingConfigStore> config)
    : repository_(std::move(repository)), engine_(std::move(engine)), config_(std::move(config)) {
}

std::vector<model::Elevator> ElevatorManager::Fleet() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListElevators(*tx);
  tx->Commit();

  std::vector<model::Elevator> fleet;
  fleet.reserve(records.size());
  for (const auto& record : records) {
    fleet.push_back(ToElevator(record));
  }
  return fleet;
}

UnitStatus ElevatorManager::StatusOf(model::Elevator elevator) const {
  UnitStatus status;
  status.movement_active = engine_->IsActive(elevator.id);
  status.pending_stops   = engine_->PendingStops(elevator.id);
  status.elevator        = std::move(elevator);
  return status;
}

CallResult ElevatorManager::AcceptCall(int from_floor, int to_floor, const std::string& requested_by) {
  std::shared_lock<std::shared_mutex> lock(config_guard_);
  const auto                          config = config_->Get();
  DispatchSelector::ValidateCall(from_floor, to_floor, config.total_floors);

  const auto fleet    = Fleet();
  const auto selected = DispatchSelector::Select(fleet, from_floor);

  const auto requester = requested_by.empty() ? std::string("anonymous") : requested_by;
  const auto accepted  = engine_->Enqueue(fleet[selected].id, from_floor, to_floor, requester);

  CallResult result;
  result.elevator_id       = accepted.id;
  result.estimated_seconds = DispatchSelector::EstimateSeconds(accepted.current_floor, from_floor, to_floor, config);

  ELEVATOR_LOG_INFO("call dispatched", {UnitField(result.elevator_id), DoubleField("estimated_seconds", result.estimated_seconds),
                                        IntField("score", DispatchSelector::Score(fleet[selected], from_floor))});
  return result;
}

UnitStatus ElevatorManager::CurrentState(const std::string& elevator_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetElevator(*tx, elevator_id);
  tx->Commit();

  if (!record) {
    throw util::NotFound("Elevator " + elevator_id + " not found");
  }
  return StatusOf(ToElevator(*record));
}

std::vector<UnitStatus> ElevatorManager::CurrentStates() {
  std::vector<UnitStatus> states;
  for (auto& elevator : Fleet()) {
    states.push_back(StatusOf(std::move(elevator)));
  }
  return states;
}

std::vector<model::ElevatorEvent> ElevatorManager::ListEvents(const std::optional<std::string>& elevator_id, uint32_t limit) {
  if (limit == 0) limit = kDefaultEventLimit;
  limit = std::min(limit, kMaxEventLimit);

  auto tx      = repository_->Begin();
  auto records = repository_->ListEvents(*tx, elevator_id, limit);
  tx->Commit();

  std::vector<model::ElevatorEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(ToEvent(record));
  }
  return events;
}

std::size_t ElevatorManager::StopAll() {
  return engine_->StopAll();
}

model::BuildingConfig ElevatorManager::GetConfig() const {
  return config_->Get();
}

model::BuildingConfig ElevatorManager::SetConfig(const model::BuildingConfigUpdate& update) {
  std::unique_lock<std::shared_mutex> lock(config_guard_);
  const auto                          merged = config_->Merge(update);

  if (update.total_floors) {
    for (const auto& elevator : Fleet()) {
      int highest = std::max(elevator.current_floor, elevator.target_floor.value_or(0));
      for (const auto& stop : engine_->PendingStops(elevator.id)) {
        highest = std::max(highest, stop.floor);
      }
      if (highest > merged.total_floors) {
        throw util::ValidationError("totalFloors " + std::to_string(merged.total_floors) + " is below floor " + std::to_string(highest) +
                                    " used by " + elevator.id);
      }
    }
  }

  config_->Set(merged);
  ELEVATOR_LOG_INFO("building config updated", {IntField("total_floors", merged.total_floors), DoubleField("floor_move_time_s", merged.floor_move_time_s),
                                                DoubleField("door_open_close_time_s", merged.door_open_close_time_s)});
  return merged;
}

void ElevatorManager::InitializeFleet(uint32_t size, const std::string& id_prefix) {
  const auto config = config_->Get();
  const auto now    = util::Now();

  auto tx      = repository_->Begin();
  auto records = repository_->ListElevators(*tx);

  if (records.empty()) {
    for (uint32_t i = 1; i <= size; ++i) {
      model::Elevator elevator;
      elevator.id           = id_prefix + std::to_string(i);
      elevator.last_updated = now;
      ThrowIfDbError(repository_->InsertElevator(*tx, ToElevatorRecord(elevator, i)), "insert elevator " + elevator.id);
    }
    tx->Commit();
    ELEVATOR_LOG_INFO("fleet initialized", {IntField("size", size), StringField("id_prefix", id_prefix)});
    return;
  }

  std::size_t recovered = 0;
  for (const auto& record : records) {
    auto elevator = ToElevator(record);
    const bool settled = elevator.state == model::MotionState::kIdle && !elevator.target_floor && elevator.direction == model::Direction::kNone &&
                         elevator.current_floor >= 1 && elevator.current_floor <= config.total_floors;
    if (settled) continue;

    elevator.current_floor = std::clamp(elevator.current_floor, 1, config.total_floors);
    elevator.target_floor.reset();
    elevator.direction    = model::Direction::kNone;
    elevator.state        = model::MotionState::kIdle;
    elevator.last_updated = now;
    ThrowIfDbError(repository_->UpdateElevator(*tx, ToElevatorRecord(elevator)), "recover elevator " + elevator.id);

    model::ElevatorEvent event;
    event.id          = util::GenerateEventId();
    event.elevator_id = elevator.id;
    event.kind        = model::EventKind::kElevatorRecovered;
    event.from_floor  = record.current_floor;
    event.to_floor    = elevator.current_floor;
    event.state       = elevator.state;
    event.direction   = elevator.direction;
    event.timestamp   = now;
    event.details     = "Recovered to idle at floor " + std::to_string(elevator.current_floor) + " after restart (was " +
                    std::string(model::ToString(record.state)) + ")";
    ThrowIfDbError(repository_->AppendEvent(*tx, ToEventRecord(event)), "append event for " + elevator.id);
    ++recovered;
  }
  tx->Commit();

  ELEVATOR_LOG_INFO("fleet loaded", {IntField("size", static_cast<int64_t>(records.size())), IntField("recovered", static_cast<int64_t>(recovered))});
  if (records.size() != size) {
    ELEVATOR_LOG_WARN("stored fleet size differs from configuration",
                      {IntField("stored", static_cast<int64_t>(records.size())), IntField("configured", size)});
  }
}

} // namespace elevator::core
