#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace elevator::model {

struct Elevator {
  std::string id;

  int                current_floor = 1;
  std::optional<int> target_floor;

  Direction   direction = Direction::kNone;
  MotionState state     = MotionState::kIdle;

  std::chrono::system_clock::time_point last_updated{};

  bool IsMoving() const {
    return model::IsMoving(state);
  }
};

} // namespace elevator::model
