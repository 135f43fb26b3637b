#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/building_config.hpp"
#include "internal/model/elevator.hpp"

namespace elevator::core {

/*
  Stateless greedy dispatch heuristic.

  Score (lower wins):
    10 * |current - pickup|
    idle                      -50
    moving toward the pickup  -20
    moving away               +30
    door phases               distance only

  Ties go to the first unit in fleet order.
*/
class DispatchSelector {
public:
  static constexpr int kDistanceWeight = 10;
  static constexpr int kIdleBonus      = 50;
  static constexpr int kTowardBonus    = 20;
  static constexpr int kAwayPenalty    = 30;

  // Throws util::ValidationError.
  static void ValidateCall(int from_floor, int to_floor, int total_floors);

  static int Score(const model::Elevator& unit, int pickup_floor);

  // Index into fleet. Throws util::ConfigurationError on an empty fleet.
  static std::size_t Select(const std::vector<model::Elevator>& fleet, int pickup_floor);

  // Advisory; ignores stops already queued on the unit.
  static double EstimateSeconds(int current_floor, int pickup_floor, int dropoff_floor, const model::BuildingConfig& config);
};

} // namespace elevator::core
