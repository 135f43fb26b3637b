#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"

namespace elevator::model {

enum class EventKind : std::uint8_t {
  kElevatorCalled,
  kFloorReached,
  kDoorsOpening,
  kDoorsOpen,
  kDoorsClosing,
  kElevatorIdle,
  kBoundaryViolation,
  kQueueDesync,
  kElevatorRecovered,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kElevatorCalled:
      return "elevator_called";
    case EventKind::kFloorReached:
      return "floor_reached";
    case EventKind::kDoorsOpening:
      return "doors_opening";
    case EventKind::kDoorsOpen:
      return "doors_open";
    case EventKind::kDoorsClosing:
      return "doors_closing";
    case EventKind::kElevatorIdle:
      return "elevator_idle";
    case EventKind::kBoundaryViolation:
      return "boundary_violation";
    case EventKind::kQueueDesync:
      return "queue_desync";
    case EventKind::kElevatorRecovered:
      return "elevator_recovered";
  }
  return "unknown";
}

constexpr std::optional<EventKind> ParseEventKind(std::string_view value) {
  for (auto kind : {EventKind::kElevatorCalled, EventKind::kFloorReached, EventKind::kDoorsOpening, EventKind::kDoorsOpen, EventKind::kDoorsClosing,
                    EventKind::kElevatorIdle, EventKind::kBoundaryViolation, EventKind::kQueueDesync, EventKind::kElevatorRecovered}) {
    if (ToString(kind) == value) {
      return kind;
    }
  }
  return std::nullopt;
}

/*
  One immutable entry of the event log.
*/
struct ElevatorEvent {
  std::string id;
  std::string elevator_id;
  EventKind   kind = EventKind::kElevatorIdle;

  int from_floor = 0;
  int to_floor   = 0;

  MotionState state     = MotionState::kIdle;
  Direction   direction = Direction::kNone;

  std::chrono::system_clock::time_point timestamp{};

  std::string details;
};

} // namespace elevator::model
