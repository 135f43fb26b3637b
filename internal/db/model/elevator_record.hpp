#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace elevator::db::model {

/*
  Persistent elevator row.

  - position fixes the fleet iteration order used by dispatch tie-breaks.
  - target_floor == 0 means "no target".
  - is_moving is not stored here; backends that keep the column derive it
    from state on write.
*/

struct ElevatorRecord {
  std::string id;
  uint32_t    position = 0;

  int current_floor = 1;
  int target_floor  = 0;

  elevator::model::MotionState state     = elevator::model::MotionState::kIdle;
  elevator::model::Direction   direction = elevator::model::Direction::kNone;

  uint64_t last_updated_ms = 0;
};

} // namespace elevator::db::model
