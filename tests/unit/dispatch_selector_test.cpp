#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/dispatch_selector.hpp"
#include "internal/util/errors.hpp"

namespace {

using elevator::core::DispatchSelector;
using elevator::model::Direction;
using elevator::model::Elevator;
using elevator::model::MotionState;

Elevator MakeUnit(const std::string& id, int floor, MotionState state = MotionState::kIdle, Direction direction = Direction::kNone) {
  Elevator unit;
  unit.id            = id;
  unit.current_floor = floor;
  unit.state         = state;
  unit.direction     = direction;
  return unit;
}

bool ThrowsValidation(int from, int to, int total, const std::string& expected) {
  try {
    DispatchSelector::ValidateCall(from, to, total);
  } catch (const elevator::util::ValidationError& e) {
    return std::string(e.what()) == expected;
  }
  return false;
}

void TestScoreComponents() {
  assert(DispatchSelector::Score(MakeUnit("a", 1), 1) == -50);
  assert(DispatchSelector::Score(MakeUnit("a", 1), 4) == -20);
  assert(DispatchSelector::Score(MakeUnit("a", 2, MotionState::kMovingUp, Direction::kUp), 5) == 10);
  assert(DispatchSelector::Score(MakeUnit("a", 6, MotionState::kMovingUp, Direction::kUp), 5) == 40);
  assert(DispatchSelector::Score(MakeUnit("a", 6, MotionState::kMovingDown, Direction::kDown), 2) == 20);
  assert(DispatchSelector::Score(MakeUnit("a", 3, MotionState::kDoorsOpen), 5) == 20);
  assert(DispatchSelector::Score(MakeUnit("a", 3, MotionState::kDoorsClosing), 3) == 0);
}

void TestMovingUnitAtPickupFloorIsAway() {
  // neither above nor below the pickup, so it takes the away penalty
  assert(DispatchSelector::Score(MakeUnit("a", 4, MotionState::kMovingUp, Direction::kUp), 4) == 30);
}

void TestSelectPrefersClosestIdle() {
  std::vector<Elevator> fleet = {MakeUnit("e1", 1), MakeUnit("e2", 5), MakeUnit("e3", 9)};
  assert(DispatchSelector::Select(fleet, 6) == 1);
  assert(DispatchSelector::Select(fleet, 10) == 2);
}

void TestSelectTieGoesToFleetOrder() {
  std::vector<Elevator> fleet = {MakeUnit("e1", 3), MakeUnit("e2", 3), MakeUnit("e3", 7)};
  assert(DispatchSelector::Select(fleet, 5) == 0);

  std::vector<Elevator> mirrored = {MakeUnit("e1", 7), MakeUnit("e2", 3)};
  assert(DispatchSelector::Select(mirrored, 5) == 0);
}

void TestSelectIdleBeatsCloserMovingAway() {
  std::vector<Elevator> fleet = {MakeUnit("e1", 5, MotionState::kMovingDown, Direction::kDown), MakeUnit("e2", 9)};
  // e1: 10 + 30 = 40, e2: 30 - 50 = -20
  assert(DispatchSelector::Select(fleet, 6) == 1);
}

void TestIdleBonusBoundary() {
  // moving toward: 10 * 3 - 20 = 10; idle: 10 * 6 - 50 = 10
  std::vector<Elevator> tie = {MakeUnit("moving", 1, MotionState::kMovingUp, Direction::kUp), MakeUnit("idle", 10)};
  assert(DispatchSelector::Select(tie, 4) == 0);
  std::swap(tie[0], tie[1]);
  assert(DispatchSelector::Select(tie, 4) == 0);

  // one floor closer and the idle unit wins outright
  std::vector<Elevator> idle_wins = {MakeUnit("moving", 1, MotionState::kMovingUp, Direction::kUp), MakeUnit("idle", 9)};
  assert(DispatchSelector::Select(idle_wins, 4) == 1);

  // moving unit sitting on the pickup floor is not heading toward it
  std::vector<Elevator> at_pickup = {MakeUnit("moving", 1, MotionState::kMovingUp, Direction::kUp), MakeUnit("idle", 2)};
  assert(DispatchSelector::Select(at_pickup, 1) == 1);
}

void TestSelectEmptyFleetThrows() {
  bool threw = false;
  try {
    (void)DispatchSelector::Select({}, 3);
  } catch (const elevator::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestValidation() {
  assert(ThrowsValidation(0, 5, 10, "Invalid floor. Building has 10 floors."));
  assert(ThrowsValidation(3, 11, 10, "Invalid floor. Building has 10 floors."));
  assert(ThrowsValidation(-2, 3, 10, "Invalid floor. Building has 10 floors."));
  assert(ThrowsValidation(4, 4, 10, "From floor and to floor cannot be the same."));

  DispatchSelector::ValidateCall(1, 10, 10);
  DispatchSelector::ValidateCall(10, 1, 10);
}

void TestEstimate() {
  elevator::model::BuildingConfig config;
  assert(DispatchSelector::EstimateSeconds(1, 3, 5, config) == 24.0);
  assert(DispatchSelector::EstimateSeconds(5, 5, 1, config) == 24.0);

  config.floor_move_time_s      = 1.0;
  config.door_open_close_time_s = 0.5;
  assert(DispatchSelector::EstimateSeconds(1, 1, 5, config) == 5.0);
  assert(DispatchSelector::EstimateSeconds(3, 1, 5, config) == 7.0);
}

} // namespace

int main() {
  TestScoreComponents();
  TestMovingUnitAtPickupFloorIsAway();
  TestSelectPrefersClosestIdle();
  TestSelectTieGoesToFleetOrder();
  TestSelectIdleBeatsCloserMovingAway();
  TestIdleBonusBoundary();
  TestSelectEmptyFleetThrows();
  TestValidation();
  TestEstimate();

  std::cout << "elevator_unit_dispatch_selector: pass\n";
  return 0;
}
