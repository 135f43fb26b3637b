#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace elevator::db::model {

struct EventRecord {
  std::string id;
  std::string elevator_id;
  std::string event;

  int from_floor = 0;
  int to_floor   = 0;

  elevator::model::MotionState state     = elevator::model::MotionState::kIdle;
  elevator::model::Direction   direction = elevator::model::Direction::kNone;

  uint64_t    timestamp_ms = 0;
  std::string details;
};

} // namespace elevator::db::model
