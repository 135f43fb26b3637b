#pragma once

#include "elevator/v1.hpp"
#include "internal/core/elevator_manager.hpp"
#include "internal/model/building_config.hpp"
#include "internal/model/elevator.hpp"
#include "internal/model/event.hpp"

namespace elevator::service {

elevator::v1::MotionState ToProto(model::MotionState state);
elevator::v1::Direction   ToProto(model::Direction direction);

elevator::v1::Elevator       ToProto(const model::Elevator& elevator);
elevator::v1::Elevator       ToProto(const core::UnitStatus& status);
elevator::v1::ElevatorEvent  ToProto(const model::ElevatorEvent& event);
elevator::v1::BuildingConfig ToProto(const model::BuildingConfig& config);

model::BuildingConfigUpdate FromProto(const elevator::v1::UpdateConfigRequest& req);

} // namespace elevator::service
