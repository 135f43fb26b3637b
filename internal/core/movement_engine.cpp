#include "movement_engine.hpp"

#include <string>
#include <utility>

#include "internal/core/elevator_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace elevator::core {

using model::Direction;
using model::EventKind;
using model::MotionState;
using observability::FloorField;
using observability::IntField;
using observability::StringField;
using observability::UnitField;

namespace {

class BoundaryViolation : public util::SimulationInconsistency {
 public:
  explicit BoundaryViolation(const std::string& msg) : util::SimulationInconsistency(msg) {
  }
};

void Transition(model::Elevator& unit, MotionState to) {
  if (!model::CanTransition(unit.state, to)) {
    throw util::SimulationInconsistency(unit.id + ": illegal transition " + std::string(model::ToString(unit.state)) + " -> " +
                                        std::string(model::ToString(to)));
  }
  unit.state = to;
}

model::ElevatorEvent MakeEvent(const model::Elevator& unit, EventKind kind, int from_floor, int to_floor, std::string details) {
  model::ElevatorEvent event;
  event.id          = util::GenerateEventId();
  event.elevator_id = unit.id;
  event.kind        = kind;
  event.from_floor  = from_floor;
  event.to_floor    = to_floor;
  event.state       = unit.state;
  event.direction   = unit.direction;
  event.timestamp   = unit.last_updated;
  event.details     = std::move(details);
  return event;
}

std::string AtFloor(int floor) {
  return "at floor " + std::to_string(floor);
}

} // namespace

MovementEngine::MovementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::Notifier> notifier,
                               std::shared_ptr<scheduler::TickScheduler> scheduler, std::shared_ptr<BuildingConfigStore> config)
    : repository_(std::move(repository)), notifier_(std::move(notifier)), scheduler_(std::move(scheduler)), config_(std::move(config)) {
}

std::shared_ptr<MovementEngine::Slot> MovementEngine::SlotFor(const std::string& elevator_id) {
  std::lock_guard<std::mutex> lock(slots_guard_);
  auto&                       slot = slots_[elevator_id];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

std::shared_ptr<MovementEngine::Slot> MovementEngine::FindSlot(const std::string& elevator_id) const {
  std::lock_guard<std::mutex> lock(slots_guard_);
  auto                        it = slots_.find(elevator_id);
  return it == slots_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------
// Call acceptance
// ---------------------------------------------------------------------

model::Elevator MovementEngine::Enqueue(const std::string& elevator_id, int pickup_floor, int dropoff_floor, const std::string& requested_by) {
  std::shared_lock<std::shared_mutex> running(stop_guard_);
  auto                                slot = SlotFor(elevator_id);
  std::lock_guard<std::mutex>         lock(slot->mutex);

  auto unit = Load(elevator_id);
  if (!unit) {
    throw util::NotFound("Elevator " + elevator_id + " not found");
  }

  const bool chain_running = slot->chain.has_value();
  const auto pushed        = slot->queue.Append(unit->current_floor, pickup_floor, dropoff_floor);

  try {
    unit->last_updated = util::Now();
    if (!chain_running) {
      const int target   = slot->queue.Head()->floor;
      unit->target_floor = target;
      unit->direction    = model::DirectionBetween(unit->current_floor, target);
    }

    auto event = MakeEvent(*unit, EventKind::kElevatorCalled, pickup_floor, dropoff_floor,
                           "Elevator called from floor " + std::to_string(pickup_floor) + " to floor " + std::to_string(dropoff_floor) + " by " +
                               requested_by);

    if (chain_running) {
      // the running chain owns the unit row
      PersistEvent(event);
    } else {
      Persist(*unit, std::move(event));
    }
  } catch (const std::exception&) {
    for (std::size_t i = 0; i < pushed; ++i) slot->queue.DropTail();
    throw;
  }

  observability::Metrics::Instance().SetPendingStops(elevator_id, slot->queue.Size());
  ELEVATOR_LOG_INFO("elevator called", {UnitField(elevator_id), FloorField("from_floor", pickup_floor),
                                        FloorField("to_floor", dropoff_floor), StringField("requested_by", requested_by),
                                        IntField("queued_stops", static_cast<int64_t>(slot->queue.Size()))});

  model::Elevator accepted = *unit;
  if (!chain_running) {
    Start(elevator_id, *slot, *unit);
  }
  return accepted;
}

// ---------------------------------------------------------------------
// Chain control
// ---------------------------------------------------------------------

void MovementEngine::Start(const std::string& elevator_id, Slot& slot, model::Elevator& unit) {
  const auto epoch = scheduler_->Epoch();

  Depart(unit);
  slot.chain = Chain{epoch, config_->Get()};

  if (!ScheduleTick(elevator_id, epoch, Delay::zero())) {
    slot.chain.reset();
    ELEVATOR_LOG_WARN("movement not started: scheduler refused tick", {UnitField(elevator_id)});
  }
}

void MovementEngine::Depart(model::Elevator& unit) {
  const int target = unit.target_floor.value_or(unit.current_floor);

  unit.direction    = model::DirectionBetween(unit.current_floor, target);
  unit.state        = unit.direction == Direction::kNone ? MotionState::kIdle : model::MovingStateFor(unit.direction);
  unit.last_updated = util::Now();
  Persist(unit, std::nullopt);
}

bool MovementEngine::ScheduleTick(const std::string& elevator_id, uint64_t epoch, Delay delay) {
  return scheduler_->ScheduleAfter(epoch, delay, [this, elevator_id, epoch] { OnTick(elevator_id, epoch); });
}

std::size_t MovementEngine::StopAll() {
  std::unique_lock<std::shared_mutex> stopping(stop_guard_);
  const auto                          cancelled = scheduler_->CancelAll();

  std::vector<std::pair<std::string, std::shared_ptr<Slot>>> slots;
  {
    std::lock_guard<std::mutex> lock(slots_guard_);
    slots.assign(slots_.begin(), slots_.end());
  }

  std::size_t cleared = 0;
  for (auto& [elevator_id, slot] : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->chain && slot->queue.Empty()) continue;

    slot->queue.Clear();
    slot->chain.reset();
    observability::Metrics::Instance().SetPendingStops(elevator_id, 0);
    Settle(elevator_id);
    ++cleared;
  }

  ELEVATOR_LOG_INFO("all movements stopped",
                    {IntField("cancelled_ticks", static_cast<int64_t>(cancelled)), IntField("units_cleared", static_cast<int64_t>(cleared))});
  return cancelled;
}

bool MovementEngine::IsActive(const std::string& elevator_id) const {
  auto slot = FindSlot(elevator_id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->chain.has_value();
}

std::vector<model::Stop> MovementEngine::PendingStops(const std::string& elevator_id) const {
  auto slot = FindSlot(elevator_id);
  if (!slot) return {};
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->queue.Snapshot();
}

// ---------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------

void MovementEngine::OnTick(const std::string& elevator_id, uint64_t epoch) {
  auto slot = FindSlot(elevator_id);
  if (!slot) return;

  const auto                  started = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(slot->mutex);

  // stopped or superseded while this tick was queued
  if (!slot->chain || slot->chain->epoch != epoch) return;

  observability::SpanScope span("MovementEngine.Tick");
  std::string              phase = "unknown";
  try {
    auto unit = Load(elevator_id);
    if (!unit) {
      throw util::NotFound("Elevator " + elevator_id + " not found");
    }
    phase = std::string(model::ToString(unit->state));
    span.TagUnit(elevator_id, phase, unit->current_floor);

    auto next = Advance(*slot, *unit);
    if (!next) {
      slot->chain.reset();
    } else if (!ScheduleTick(elevator_id, epoch, *next)) {
      slot->chain.reset();
      ELEVATOR_LOG_DEBUG("movement chain ended by stop", {UnitField(elevator_id)});
    }
  } catch (const BoundaryViolation& e) {
    span.RecordException(e.what());
    Heal(*slot, elevator_id, EventKind::kBoundaryViolation, e.what());
  } catch (const util::SimulationInconsistency& e) {
    span.RecordException(e.what());
    Heal(*slot, elevator_id, EventKind::kQueueDesync, e.what());
  } catch (const util::NotFound& e) {
    span.RecordException(e.what());
    ELEVATOR_LOG_WARN("movement aborted", {UnitField(elevator_id), StringField("error", e.what())});
    slot->chain.reset();
    slot->queue.Clear();
  } catch (const std::exception& e) {
    // queue kept: the next call restarts the chain
    span.RecordException(e.what());
    ELEVATOR_LOG_ERROR("movement tick failed", {UnitField(elevator_id), StringField("phase", phase), StringField("error", e.what()),
                                                IntField("queued_stops", static_cast<int64_t>(slot->queue.Size()))});
    slot->chain.reset();
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().RecordTick(phase, elapsed);
}

std::optional<MovementEngine::Delay> MovementEngine::Advance(Slot& slot, model::Elevator& unit) {
  const auto head = slot.queue.Head();
  if (!unit.target_floor) {
    throw util::SimulationInconsistency(unit.id + ": moving without a target floor");
  }
  if (!head || head->floor != *unit.target_floor) {
    throw util::SimulationInconsistency(unit.id + ": target floor " + std::to_string(*unit.target_floor) + " does not match stop queue head " +
                                        (head ? std::to_string(head->floor) : std::string("<empty>")));
  }

  const auto& chain = *slot.chain;
  const auto  door  = util::SecondsToMillis(chain.config.door_open_close_time_s);

  switch (unit.state) {
    case MotionState::kIdle:
    case MotionState::kMovingUp:
    case MotionState::kMovingDown:
      if (unit.current_floor != *unit.target_floor) {
        return Step(chain, unit);
      }
      return EnterDoorPhase(unit, MotionState::kDoorsOpening, door);
    case MotionState::kDoorsOpening:
      return EnterDoorPhase(unit, MotionState::kDoorsOpen, kDoorDwell);
    case MotionState::kDoorsOpen:
      return EnterDoorPhase(unit, MotionState::kDoorsClosing, door);
    case MotionState::kDoorsClosing:
      return Complete(slot, unit);
  }
  throw util::SimulationInconsistency(unit.id + ": unknown motion state");
}

MovementEngine::Delay MovementEngine::Step(const Chain& chain, model::Elevator& unit) {
  Direction direction = unit.direction;
  if (unit.state == MotionState::kMovingUp) {
    direction = Direction::kUp;
  } else if (unit.state == MotionState::kMovingDown) {
    direction = Direction::kDown;
  } else if (direction == Direction::kNone) {
    direction = model::DirectionBetween(unit.current_floor, *unit.target_floor);
  }

  const int from = unit.current_floor;
  const int to   = direction == Direction::kUp ? from + 1 : from - 1;
  if (to < 1 || to > chain.config.total_floors) {
    throw BoundaryViolation(unit.id + ": next floor " + std::to_string(to) + " outside building of " + std::to_string(chain.config.total_floors) +
                            " floors");
  }

  unit.current_floor = to;
  unit.direction     = direction;
  Transition(unit, model::MovingStateFor(direction));
  unit.last_updated = util::Now();
  Persist(unit, MakeEvent(unit, EventKind::kFloorReached, from, to, "Elevator moved to floor " + std::to_string(to)));
  ELEVATOR_LOG_MOVEMENT("floor reached", {UnitField(unit.id), FloorField("floor", to), FloorField("target_floor", *unit.target_floor)});

  return util::SecondsToMillis(chain.config.floor_move_time_s);
}

MovementEngine::Delay MovementEngine::EnterDoorPhase(model::Elevator& unit, MotionState phase, Delay wait) {
  Transition(unit, phase);
  unit.direction    = Direction::kNone;
  unit.last_updated = util::Now();

  EventKind   kind = EventKind::kDoorsOpening;
  std::string details;
  switch (phase) {
    case MotionState::kDoorsOpening:
      details = "Doors opening " + AtFloor(unit.current_floor);
      break;
    case MotionState::kDoorsOpen:
      kind    = EventKind::kDoorsOpen;
      details = "Doors open " + AtFloor(unit.current_floor);
      break;
    default:
      kind    = EventKind::kDoorsClosing;
      details = "Doors closing " + AtFloor(unit.current_floor);
      break;
  }

  Persist(unit, MakeEvent(unit, kind, unit.current_floor, unit.current_floor, std::move(details)));
  ELEVATOR_LOG_MOVEMENT(model::ToString(kind), {UnitField(unit.id), FloorField("floor", unit.current_floor), IntField("wait_ms", wait.count())});
  return wait;
}

std::optional<MovementEngine::Delay> MovementEngine::Complete(Slot& slot, model::Elevator& unit) {
  slot.queue.PopHead(unit.current_floor);
  observability::Metrics::Instance().SetPendingStops(unit.id, slot.queue.Size());
  Transition(unit, MotionState::kIdle);

  if (const auto next = slot.queue.Head()) {
    // brief idle with the next target, then leave again on current timings
    unit.target_floor = next->floor;
    unit.direction    = model::DirectionBetween(unit.current_floor, next->floor);
    unit.last_updated = util::Now();
    Persist(unit, std::nullopt);

    slot.chain->config = config_->Get();
    Depart(unit);
    return Delay::zero();
  }

  unit.target_floor.reset();
  unit.direction    = Direction::kNone;
  unit.last_updated = util::Now();
  Persist(unit, MakeEvent(unit, EventKind::kElevatorIdle, unit.current_floor, unit.current_floor, "Elevator idle " + AtFloor(unit.current_floor)));

  ELEVATOR_LOG_INFO("elevator idle", {UnitField(unit.id), FloorField("floor", unit.current_floor)});
  return std::nullopt;
}

void MovementEngine::Heal(Slot& slot, const std::string& elevator_id, EventKind kind, const std::string& reason) {
  ELEVATOR_LOG_WARN("simulation inconsistency, settling unit to idle",
                    {UnitField(elevator_id), StringField("kind", model::ToString(kind)), StringField("reason", reason)});
  observability::Metrics::Instance().RecordHeal(model::ToString(kind));

  slot.chain.reset();
  slot.queue.Clear();
  observability::Metrics::Instance().SetPendingStops(elevator_id, 0);

  try {
    auto unit = Load(elevator_id);
    if (!unit) return;

    unit->state     = MotionState::kIdle;
    unit->direction = Direction::kNone;
    if (kind == EventKind::kBoundaryViolation) {
      unit->target_floor = 1;
    } else {
      unit->target_floor.reset();
    }
    unit->last_updated = util::Now();

    const auto details = kind == EventKind::kBoundaryViolation ? "Elevator stopped at invalid floor boundary: " + reason : reason;
    Persist(*unit, MakeEvent(*unit, kind, unit->current_floor, unit->current_floor, details));
  } catch (const std::exception& e) {
    ELEVATOR_LOG_ERROR("failed to persist healed unit", {UnitField(elevator_id), StringField("error", e.what())});
  }
}

void MovementEngine::Settle(const std::string& elevator_id) {
  try {
    auto unit = Load(elevator_id);
    if (!unit) return;
    if (unit->state == MotionState::kIdle && !unit->target_floor && unit->direction == Direction::kNone) return;

    unit->state     = MotionState::kIdle;
    unit->direction = Direction::kNone;
    unit->target_floor.reset();
    unit->last_updated = util::Now();
    Persist(*unit, MakeEvent(*unit, EventKind::kElevatorIdle, unit->current_floor, unit->current_floor,
                             "Elevator stopped " + AtFloor(unit->current_floor)));
  } catch (const std::exception& e) {
    ELEVATOR_LOG_ERROR("failed to persist stopped unit", {UnitField(elevator_id), StringField("error", e.what())});
  }
}

// ---------------------------------------------------------------------
// Store + notifier
// ---------------------------------------------------------------------

std::optional<model::Elevator> MovementEngine::Load(const std::string& elevator_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetElevator(*tx, elevator_id);
  tx->Commit();
  if (!record) return std::nullopt;
  return ToElevator(*record);
}

void MovementEngine::Persist(model::Elevator& unit, std::optional<model::ElevatorEvent> event) {
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpdateElevator(*tx, ToElevatorRecord(unit)), "update elevator " + unit.id);
    if (event) {
      ThrowIfDbError(repository_->AppendEvent(*tx, ToEventRecord(*event)), "append event for " + unit.id);
    }
    tx->Commit();
  }

  notifier_->PublishElevatorChanged(unit);
  if (event) {
    notifier_->PublishEvent(*event);
  }
}

void MovementEngine::PersistEvent(const model::ElevatorEvent& event) {
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->AppendEvent(*tx, ToEventRecord(event)), "append event for " + event.elevator_id);
    tx->Commit();
  }
  notifier_->PublishEvent(event);
}

} // namespace elevator::core
