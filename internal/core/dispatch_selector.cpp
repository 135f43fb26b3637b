#include "dispatch_selector.hpp"

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace elevator::core {

using model::Direction;
using model::MotionState;

void DispatchSelector::ValidateCall(int from_floor, int to_floor, int total_floors) {
  if (from_floor < 1 || from_floor > total_floors || to_floor < 1 || to_floor > total_floors) {
    throw util::ValidationError("Invalid floor. Building has " + std::to_string(total_floors) + " floors.");
  }
  if (from_floor == to_floor) {
    throw util::ValidationError("From floor and to floor cannot be the same.");
  }
}

int DispatchSelector::Score(const model::Elevator& unit, int pickup_floor) {
  int score = kDistanceWeight * std::abs(unit.current_floor - pickup_floor);

  if (unit.state == MotionState::kIdle) {
    return score - kIdleBonus;
  }

  if (unit.IsMoving()) {
    const bool toward = (unit.direction == Direction::kUp && pickup_floor > unit.current_floor) ||
                        (unit.direction == Direction::kDown && pickup_floor < unit.current_floor);
    score += toward ? -kTowardBonus : kAwayPenalty;
  }

  return score;
}

std::size_t DispatchSelector::Select(const std::vector<model::Elevator>& fleet, int pickup_floor) {
  if (fleet.empty()) {
    throw util::ConfigurationError("no elevators configured");
  }

  std::size_t best       = 0;
  int         best_score = Score(fleet.front(), pickup_floor);
  for (std::size_t i = 1; i < fleet.size(); ++i) {
    const int score = Score(fleet[i], pickup_floor);
    if (score < best_score) {
      best       = i;
      best_score = score;
    }
  }
  return best;
}

double DispatchSelector::EstimateSeconds(int current_floor, int pickup_floor, int dropoff_floor, const model::BuildingConfig& config) {
  const int floors = std::abs(current_floor - pickup_floor) + std::abs(pickup_floor - dropoff_floor);
  return floors * config.floor_move_time_s + 2 * config.door_open_close_time_s;
}

} // namespace elevator::core
