#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/core/building_config_store.hpp"
#include "internal/core/elevator_manager.hpp"
#include "internal/core/movement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/event_hub.hpp"
#include "internal/scheduler/thread_tick_scheduler.hpp"

namespace {

using elevator::model::MotionState;
using namespace std::chrono_literals;

struct Runtime {
  explicit Runtime(double floor_move_time_s, uint32_t fleet_size = 2) {
    elevator::model::BuildingConfig building;
    building.floor_move_time_s      = floor_move_time_s;
    building.door_open_close_time_s = 0.01;

    repository = std::make_shared<elevator::db::memory::MemoryRepository>();
    events     = std::make_shared<elevator::notify::EventHub>();
    scheduler  = std::make_shared<elevator::scheduler::ThreadTickScheduler>(2);
    config     = std::make_shared<elevator::core::BuildingConfigStore>(building);
    engine     = std::make_shared<elevator::core::MovementEngine>(repository, events, scheduler, config);
    manager    = std::make_shared<elevator::core::ElevatorManager>(repository, engine, config);

    manager->InitializeFleet(fleet_size, "elevator-");
    scheduler->Start();
  }

  ~Runtime() {
    manager->StopAll();
    scheduler->Shutdown();
    events->Shutdown();
  }

  std::shared_ptr<elevator::db::memory::MemoryRepository>   repository;
  std::shared_ptr<elevator::notify::EventHub>               events;
  std::shared_ptr<elevator::scheduler::ThreadTickScheduler> scheduler;
  std::shared_ptr<elevator::core::BuildingConfigStore>      config;
  std::shared_ptr<elevator::core::MovementEngine>           engine;
  std::shared_ptr<elevator::core::ElevatorManager>          manager;
};

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

bool SettledAt(Runtime& rt, const std::string& id, int floor) {
  const auto status = rt.manager->CurrentState(id);
  return !status.movement_active && status.elevator.state == MotionState::kIdle && status.elevator.current_floor == floor;
}

void TestUnitsMoveInParallel() {
  Runtime rt(0.01);

  const auto first  = rt.manager->AcceptCall(1, 4);
  const auto second = rt.manager->AcceptCall(1, 3);
  assert(first.elevator_id == "elevator-1");
  assert(second.elevator_id == "elevator-2");

  // one door dwell each, run side by side
  const auto started = std::chrono::steady_clock::now();
  assert(WaitFor([&] { return SettledAt(rt, "elevator-1", 4) && SettledAt(rt, "elevator-2", 3); }, 10s));
  assert(std::chrono::steady_clock::now() - started < 3500ms);
}

void TestStopAllFreezesMovingUnit() {
  Runtime rt(0.2, 1);

  rt.manager->AcceptCall(1, 10);
  assert(WaitFor([&] { return rt.manager->CurrentState("elevator-1").elevator.current_floor >= 2; }, 5s));

  rt.manager->StopAll();
  const int stopped_at = rt.manager->CurrentState("elevator-1").elevator.current_floor;
  std::this_thread::sleep_for(600ms);

  const auto status = rt.manager->CurrentState("elevator-1");
  assert(status.elevator.current_floor == stopped_at);
  assert(status.elevator.state == MotionState::kIdle);
  assert(!status.elevator.target_floor.has_value());
  assert(!status.movement_active);
  assert(status.pending_stops.empty());
  assert(rt.scheduler->Pending() == 0);
}

} // namespace

int main() {
  TestUnitsMoveInParallel();
  TestStopAllFreezesMovingUnit();

  std::cout << "elevator_integration_movement_realtime: pass\n";
  return 0;
}
