#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "support/engine_fixture.hpp"
#include "support/failing_repository.hpp"

namespace {

using elevator::model::Direction;
using elevator::model::ElevatorEvent;
using elevator::model::EventKind;
using elevator::model::MotionState;
using elevator::testing::EngineFixture;
using ms = std::chrono::milliseconds;

// Oldest first.
std::vector<ElevatorEvent> History(EngineFixture& f, const std::string& id = "elevator-1") {
  auto events = f.manager->ListEvents(id, 1000);
  std::reverse(events.begin(), events.end());
  return events;
}

std::vector<int> FloorsReached(EngineFixture& f) {
  std::vector<int> floors;
  for (const auto& event : History(f)) {
    if (event.kind == EventKind::kFloorReached) floors.push_back(event.to_floor);
  }
  return floors;
}

void Tamper(EngineFixture& f, int current_floor, int target_floor) {
  auto tx     = f.repository->Begin();
  auto record = f.repository->GetElevator(*tx, "elevator-1");
  assert(record.has_value());
  record->current_floor = current_floor;
  record->target_floor  = target_floor;
  assert(f.repository->UpdateElevator(*tx, *record));
  tx->Commit();
}

void TestFullJourney() {
  EngineFixture f;
  auto          watch = f.events->Subscribe();

  const auto call = f.manager->AcceptCall(3, 5, "lobby-panel");
  assert(call.elevator_id == "elevator-1");
  assert(call.estimated_seconds == 24.0);

  auto unit = f.Unit();
  assert(unit.state == MotionState::kMovingUp);
  assert(unit.direction == Direction::kUp);
  assert(unit.target_floor == 3);
  assert(unit.current_floor == 1);
  assert(f.engine->IsActive("elevator-1"));
  assert(f.engine->PendingStops("elevator-1").size() == 2);

  assert(f.scheduler->RunAll() == 12);

  unit = f.Unit();
  assert(unit.current_floor == 5);
  assert(unit.state == MotionState::kIdle);
  assert(unit.direction == Direction::kNone);
  assert(!unit.target_floor.has_value());
  assert(!f.engine->IsActive("elevator-1"));
  assert(f.engine->PendingStops("elevator-1").empty());

  const std::vector<EventKind> expected = {
      EventKind::kElevatorCalled, EventKind::kFloorReached, EventKind::kFloorReached, EventKind::kDoorsOpening, EventKind::kDoorsOpen,
      EventKind::kDoorsClosing,   EventKind::kFloorReached, EventKind::kFloorReached, EventKind::kDoorsOpening, EventKind::kDoorsOpen,
      EventKind::kDoorsClosing,   EventKind::kElevatorIdle};
  const auto history = History(f);
  assert(history.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(history[i].kind == expected[i]);
    assert(history[i].elevator_id == "elevator-1");
  }
  assert(history[0].details == "Elevator called from floor 3 to floor 5 by lobby-panel");
  assert(history[3].state == MotionState::kDoorsOpening && history[3].direction == Direction::kNone);
  assert(history[3].from_floor == 3 && history[3].to_floor == 3);

  const std::vector<ms> delays = {ms(0), ms(5000), ms(5000), ms(2000), ms(2000), ms(2000),
                                  ms(0), ms(5000), ms(5000), ms(2000), ms(2000), ms(2000)};
  assert(f.scheduler->Delays() == delays);
  assert(f.scheduler->Now() == ms(32000));

  std::size_t published_events = 0;
  while (auto update = watch->Next(ms(0))) {
    if (std::holds_alternative<ElevatorEvent>(*update)) ++published_events;
  }
  assert(published_events == expected.size());
}

void TestCallsAreServedFirstComeFirstServed() {
  EngineFixture f;

  f.manager->AcceptCall(1, 4);
  f.manager->AcceptCall(2, 6);

  const auto pending = f.engine->PendingStops("elevator-1");
  assert(pending.size() == 3);
  assert(pending[0].floor == 4 && pending[1].floor == 2 && pending[2].floor == 6);
  // the running chain keeps its target
  assert(f.Unit().target_floor == 4);

  f.scheduler->RunAll();

  assert((FloorsReached(f) == std::vector<int>{2, 3, 4, 3, 2, 3, 4, 5, 6}));
  assert(f.Unit().current_floor == 6);
  assert(f.Unit().state == MotionState::kIdle);

  const auto history = History(f);
  assert(history[1].kind == EventKind::kElevatorCalled);
  assert(history[1].details == "Elevator called from floor 2 to floor 6 by anonymous");
}

void TestStopAllHaltsInPlaceAndIsIdempotent() {
  EngineFixture f;

  f.manager->AcceptCall(1, 8);
  for (int i = 0; i < 3; ++i) f.scheduler->RunNext();
  assert(f.Unit().current_floor == 4);

  assert(f.manager->StopAll() == 1);
  assert(!f.engine->IsActive("elevator-1"));
  assert(f.engine->PendingStops("elevator-1").empty());
  assert(f.scheduler->Pending() == 0);
  assert(f.scheduler->RunAll() == 0);

  // settled where it stood
  auto unit = f.Unit();
  assert(unit.current_floor == 4);
  assert(unit.state == MotionState::kIdle);
  assert(unit.direction == Direction::kNone);
  assert(!unit.target_floor.has_value());
  assert(!unit.IsMoving());

  const auto last = f.manager->ListEvents("elevator-1", 1);
  assert(last[0].kind == EventKind::kElevatorIdle);
  assert(last[0].details == "Elevator stopped at floor 4");

  const auto events_after_first_stop = History(f).size();
  assert(f.manager->StopAll() == 0);
  assert(History(f).size() == events_after_first_stop);

  // a later call starts a fresh chain from where the unit stopped
  f.manager->AcceptCall(4, 2);
  f.scheduler->RunAll();
  assert(f.Unit().current_floor == 2);
  assert(f.Unit().state == MotionState::kIdle);
}

void TestStopAllDropsStaleTickOfRestartedUnit() {
  EngineFixture f;

  f.manager->AcceptCall(1, 3);
  f.manager->StopAll();
  f.manager->AcceptCall(1, 2);

  // only the new chain's tick survives
  assert(f.scheduler->Pending() == 1);
  f.scheduler->RunAll();
  assert((FloorsReached(f) == std::vector<int>{2}));
}

void TestCallDuringStopAllStartsAfterIt() {
  EngineFixture f;
  f.manager->AcceptCall(1, 3);

  std::thread caller;
  f.scheduler->on_cancel = [&] {
    caller = std::thread([&] { f.manager->AcceptCall(1, 5, "racing-panel"); });
    // long enough for the call to reach the engine while the stop is running
    std::this_thread::sleep_for(ms(50));
  };

  assert(f.manager->StopAll() == 1);
  caller.join();
  f.scheduler->on_cancel = nullptr;

  // the late call owns a fresh chain with exactly one tick behind it
  auto unit = f.Unit();
  assert(f.engine->IsActive("elevator-1"));
  assert(f.scheduler->Pending() == 1);
  assert(unit.state == MotionState::kMovingUp);
  assert(unit.target_floor == 5);
  const auto pending = f.engine->PendingStops("elevator-1");
  assert(pending.size() == 1 && pending[0].floor == 5);

  f.scheduler->RunAll();
  unit = f.Unit();
  assert(unit.current_floor == 5);
  assert(unit.state == MotionState::kIdle);
  assert(!unit.target_floor.has_value());
  assert(!f.engine->IsActive("elevator-1"));
}

void TestDoorsStayStillWhileStopsWait() {
  EngineFixture f;

  f.manager->AcceptCall(2, 4);
  f.manager->AcceptCall(3, 1);

  std::size_t door_ticks = 0;
  while (f.scheduler->RunNext()) {
    const auto status = f.manager->CurrentState("elevator-1");
    const auto state  = status.elevator.state;
    if (state != MotionState::kDoorsOpening && state != MotionState::kDoorsOpen && state != MotionState::kDoorsClosing) continue;

    ++door_ticks;
    assert(!status.elevator.IsMoving());
    assert(status.elevator.direction == Direction::kNone);
    // every stop before the last still has later stops queued behind it
    if (status.elevator.current_floor != 1) {
      assert(status.pending_stops.size() >= 2);
    }
  }
  // three door phases at each of floors 2, 4, 3 and 1
  assert(door_ticks == 12);
  assert(f.Unit().current_floor == 1);
}

void TestDoorTimingUsesConfiguredDoorTimeAndFixedDwell() {
  elevator::model::BuildingConfig building;
  building.door_open_close_time_s = 0.5;
  EngineFixture f(1, building);

  f.manager->AcceptCall(1, 2);
  f.scheduler->RunAll();

  // start, one floor, opening, dwell, closing
  const std::vector<ms> delays = {ms(0), ms(5000), ms(500), ms(2000), ms(500)};
  assert(f.scheduler->Delays() == delays);
  assert(f.scheduler->Now() == ms(8000));
  assert(f.Unit().state == MotionState::kIdle);
}

void TestBoundaryViolationHeals() {
  EngineFixture f;

  f.manager->AcceptCall(1, 5);
  Tamper(f, 10, 5);
  f.scheduler->RunAll();

  const auto unit = f.Unit();
  assert(unit.state == MotionState::kIdle);
  assert(unit.direction == Direction::kNone);
  assert(unit.target_floor == 1);
  assert(unit.current_floor == 10);
  assert(!f.engine->IsActive("elevator-1"));
  assert(f.engine->PendingStops("elevator-1").empty());

  const auto last = f.manager->ListEvents("elevator-1", 1);
  assert(last.size() == 1);
  assert(last[0].kind == EventKind::kBoundaryViolation);
  assert(last[0].details.rfind("Elevator stopped at invalid floor boundary", 0) == 0);
}

void TestQueueDesyncHeals() {
  EngineFixture f;

  f.manager->AcceptCall(1, 5);
  Tamper(f, 1, 7);
  f.scheduler->RunAll();

  const auto unit = f.Unit();
  assert(unit.state == MotionState::kIdle);
  assert(!unit.target_floor.has_value());
  assert(!f.engine->IsActive("elevator-1"));

  const auto last = f.manager->ListEvents("elevator-1", 1);
  assert(last[0].kind == EventKind::kQueueDesync);

  // healed units accept new work
  f.manager->AcceptCall(1, 2);
  f.scheduler->RunAll();
  assert(f.Unit().current_floor == 2);
}

void TestFailedCallLeavesNoTrace() {
  auto          repo = std::make_shared<elevator::testing::FailingRepository>();
  EngineFixture f(1, {}, repo);

  repo->fail_events = true;
  bool threw        = false;
  try {
    f.manager->AcceptCall(1, 5);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.engine->PendingStops("elevator-1").empty());
  assert(!f.engine->IsActive("elevator-1"));
  assert(!f.Unit().target_floor.has_value());
  assert(f.scheduler->Pending() == 0);
}

void TestFailedTickKeepsQueueForRestart() {
  auto          repo = std::make_shared<elevator::testing::FailingRepository>();
  EngineFixture f(1, {}, repo);

  f.manager->AcceptCall(1, 3);
  repo->fail_updates = true;
  f.scheduler->RunAll();

  assert(!f.engine->IsActive("elevator-1"));
  assert(f.engine->PendingStops("elevator-1").size() == 1);
  assert(f.Unit().current_floor == 1);

  repo->fail_updates = false;
  f.manager->AcceptCall(2, 4);
  f.scheduler->RunAll();

  assert((FloorsReached(f) == std::vector<int>{2, 3, 2, 3, 4}));
  assert(f.engine->PendingStops("elevator-1").empty());
}

void TestConfigChangeAppliesFromNextLeg() {
  EngineFixture f;

  f.manager->AcceptCall(2, 4);
  f.scheduler->RunNext();
  f.scheduler->RunNext();

  elevator::model::BuildingConfigUpdate update;
  update.floor_move_time_s = 1.0;
  f.manager->SetConfig(update);

  f.scheduler->RunAll();

  const std::vector<ms> delays = {ms(0), ms(5000), ms(2000), ms(2000), ms(2000), ms(0), ms(1000), ms(1000), ms(2000), ms(2000), ms(2000)};
  assert(f.scheduler->Delays() == delays);
}

} // namespace

int main() {
  TestFullJourney();
  TestCallsAreServedFirstComeFirstServed();
  TestStopAllHaltsInPlaceAndIsIdempotent();
  TestStopAllDropsStaleTickOfRestartedUnit();
  TestCallDuringStopAllStartsAfterIt();
  TestDoorsStayStillWhileStopsWait();
  TestDoorTimingUsesConfiguredDoorTimeAndFixedDwell();
  TestBoundaryViolationHeals();
  TestQueueDesyncHeals();
  TestFailedCallLeavesNoTrace();
  TestFailedTickKeepsQueueForRestart();
  TestConfigChangeAppliesFromNextLeg();

  std::cout << "elevator_unit_movement_engine: pass\n";
  return 0;
}
