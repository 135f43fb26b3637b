#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace elevator::service {

using namespace elevator::v1;

elevator::v1::MotionState ToProto(model::MotionState state) {
  switch (state) {
    case model::MotionState::kIdle:
      return MOTION_STATE_IDLE;
    case model::MotionState::kMovingUp:
      return MOTION_STATE_MOVING_UP;
    case model::MotionState::kMovingDown:
      return MOTION_STATE_MOVING_DOWN;
    case model::MotionState::kDoorsOpening:
      return MOTION_STATE_DOORS_OPENING;
    case model::MotionState::kDoorsOpen:
      return MOTION_STATE_DOORS_OPEN;
    case model::MotionState::kDoorsClosing:
      return MOTION_STATE_DOORS_CLOSING;
  }
  return MOTION_STATE_UNSPECIFIED;
}

elevator::v1::Direction ToProto(model::Direction direction) {
  switch (direction) {
    case model::Direction::kUp:
      return DIRECTION_UP;
    case model::Direction::kDown:
      return DIRECTION_DOWN;
    default:
      return DIRECTION_NONE;
  }
}

elevator::v1::Elevator ToProto(const model::Elevator& elevator) {
  elevator::v1::Elevator out;
  out.set_id(elevator.id);
  out.set_current_floor(elevator.current_floor);
  out.set_target_floor(elevator.target_floor.value_or(0));
  out.set_direction(ToProto(elevator.direction));
  out.set_state(ToProto(elevator.state));
  out.set_is_moving(elevator.IsMoving());
  *out.mutable_last_updated() = util::ToProto(elevator.last_updated);
  return out;
}

elevator::v1::Elevator ToProto(const core::UnitStatus& status) {
  auto out = ToProto(status.elevator);
  out.set_movement_active(status.movement_active);
  for (const auto& stop : status.pending_stops) {
    out.add_pending_stops(stop.floor);
  }
  return out;
}

elevator::v1::ElevatorEvent ToProto(const model::ElevatorEvent& event) {
  elevator::v1::ElevatorEvent out;
  out.set_id(event.id);
  out.set_elevator_id(event.elevator_id);
  out.set_event(std::string(model::ToString(event.kind)));
  out.set_from_floor(event.from_floor);
  out.set_to_floor(event.to_floor);
  out.set_state(ToProto(event.state));
  out.set_direction(ToProto(event.direction));
  *out.mutable_timestamp() = util::ToProto(event.timestamp);
  out.set_details(event.details);
  return out;
}

elevator::v1::BuildingConfig ToProto(const model::BuildingConfig& config) {
  elevator::v1::BuildingConfig out;
  out.set_total_floors(config.total_floors);
  out.set_floor_move_time_s(config.floor_move_time_s);
  out.set_door_open_close_time_s(config.door_open_close_time_s);
  return out;
}

model::BuildingConfigUpdate FromProto(const UpdateConfigRequest& req) {
  model::BuildingConfigUpdate update;
  if (req.has_total_floors()) update.total_floors = req.total_floors();
  if (req.has_floor_move_time_s()) update.floor_move_time_s = req.floor_move_time_s();
  if (req.has_door_open_close_time_s()) update.door_open_close_time_s = req.door_open_close_time_s();
  return update;
}

} // namespace elevator::service
