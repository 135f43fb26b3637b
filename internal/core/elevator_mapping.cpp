#include "elevator_mapping.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace elevator::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

model::Elevator ToElevator(const db::model::ElevatorRecord& record) {
  model::Elevator elevator;
  elevator.id            = record.id;
  elevator.current_floor = record.current_floor;
  if (record.target_floor != 0) {
    elevator.target_floor = record.target_floor;
  }
  elevator.direction    = record.direction;
  elevator.state        = record.state;
  elevator.last_updated = util::FromUnixMillis(record.last_updated_ms);
  return elevator;
}

db::model::ElevatorRecord ToElevatorRecord(const model::Elevator& elevator, uint32_t position) {
  db::model::ElevatorRecord record;
  record.id              = elevator.id;
  record.position        = position;
  record.current_floor   = elevator.current_floor;
  record.target_floor    = elevator.target_floor.value_or(0);
  record.state           = elevator.state;
  record.direction       = elevator.direction;
  record.last_updated_ms = util::ToUnixMillis(elevator.last_updated);
  return record;
}

model::ElevatorEvent ToEvent(const db::model::EventRecord& record) {
  model::ElevatorEvent event;
  event.id          = record.id;
  event.elevator_id = record.elevator_id;
  event.kind        = model::ParseEventKind(record.event).value_or(model::EventKind::kElevatorIdle);
  event.from_floor  = record.from_floor;
  event.to_floor    = record.to_floor;
  event.state       = record.state;
  event.direction   = record.direction;
  event.timestamp   = util::FromUnixMillis(record.timestamp_ms);
  event.details     = record.details;
  return event;
}

db::model::EventRecord ToEventRecord(const model::ElevatorEvent& event) {
  db::model::EventRecord record;
  record.id           = event.id;
  record.elevator_id  = event.elevator_id;
  record.event        = std::string(model::ToString(event.kind));
  record.from_floor   = event.from_floor;
  record.to_floor     = event.to_floor;
  record.state        = event.state;
  record.direction    = event.direction;
  record.timestamp_ms = util::ToUnixMillis(event.timestamp);
  record.details      = event.details;
  return record;
}

} // namespace elevator::core
