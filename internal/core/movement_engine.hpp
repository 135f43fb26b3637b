#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/building_config_store.hpp"
#include "internal/core/stop_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/elevator.hpp"
#include "internal/model/event.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/scheduler/tick_scheduler.hpp"

namespace elevator::core {

/*
  Drives every unit through its stop queue, one tick at a time.

  Per unit the engine keeps a slot: a mutex, the stop queue and the handle of
  the running chain (if any). Call acceptance and every tick of a unit run
  under that unit's mutex, so a unit has one writer and at most one chain.
  Different units tick in parallel on the scheduler's workers.

  Tick sequence for one stop:

    moving_*  --floor_reached--> ... (floor_move_time_s each)
    arrival   --doors_opening--> wait door_open_close_time_s
              --doors_open-----> wait kDoorDwell
              --doors_closing--> wait door_open_close_time_s
    complete  pop the served stop; next stop or settle idle

  Every step commits the unit row and its event in one transaction, then
  publishes both, then schedules the next tick. A chain keeps the building
  config it started with until it moves on to the next stop.

  The scheduler must be shut down before the engine is destroyed.
*/
class MovementEngine {
 public:
  static constexpr std::chrono::milliseconds kDoorDwell{2000};

  MovementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::Notifier> notifier,
                 std::shared_ptr<scheduler::TickScheduler> scheduler, std::shared_ptr<BuildingConfigStore> config);

  MovementEngine(const MovementEngine&)            = delete;
  MovementEngine& operator=(const MovementEngine&) = delete;

  // Appends pickup/dropoff stops to the unit's queue and records the call.
  // Starts a chain when none is running. Returns the unit as persisted at
  // acceptance. Throws util::NotFound for an unknown unit.
  model::Elevator Enqueue(const std::string& elevator_id, int pickup_floor, int dropoff_floor, const std::string& requested_by);

  // Cancels every scheduled tick and clears all queues and chains. Units that
  // had work are settled to idle where they stand. Ticks already running
  // finish their writes but cannot schedule again; calls arriving meanwhile
  // wait and start fresh chains afterwards. Returns the number of cancelled
  // ticks.
  std::size_t StopAll();

  bool                     IsActive(const std::string& elevator_id) const;
  std::vector<model::Stop> PendingStops(const std::string& elevator_id) const;

 private:
  struct Chain {
    uint64_t              epoch = 0;
    model::BuildingConfig config;
  };

  struct Slot {
    std::mutex           mutex;
    StopQueue            queue;
    std::optional<Chain> chain;
  };

  using Delay = scheduler::TickScheduler::Duration;

  std::shared_ptr<Slot> SlotFor(const std::string& elevator_id);
  std::shared_ptr<Slot> FindSlot(const std::string& elevator_id) const;

  // Slot mutex held by the caller for all of the following.
  void                 Start(const std::string& elevator_id, Slot& slot, model::Elevator& unit);
  void                 Depart(model::Elevator& unit);
  bool                 ScheduleTick(const std::string& elevator_id, uint64_t epoch, Delay delay);
  void                 OnTick(const std::string& elevator_id, uint64_t epoch);
  std::optional<Delay> Advance(Slot& slot, model::Elevator& unit);
  Delay                Step(const Chain& chain, model::Elevator& unit);
  Delay                EnterDoorPhase(model::Elevator& unit, model::MotionState phase, Delay wait);
  std::optional<Delay> Complete(Slot& slot, model::Elevator& unit);
  void                 Heal(Slot& slot, const std::string& elevator_id, model::EventKind kind, const std::string& reason);
  void                 Settle(const std::string& elevator_id);

  std::optional<model::Elevator> Load(const std::string& elevator_id);
  void                           Persist(model::Elevator& unit, std::optional<model::ElevatorEvent> event);
  void                           PersistEvent(const model::ElevatorEvent& event);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<notify::Notifier>         notifier_;
  std::shared_ptr<scheduler::TickScheduler> scheduler_;
  std::shared_ptr<BuildingConfigStore>      config_;

  // shared by call acceptance, exclusive for StopAll
  std::shared_mutex stop_guard_;

  mutable std::mutex                                     slots_guard_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace elevator::core
