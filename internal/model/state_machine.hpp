#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace elevator::model {

/*
  Single source of truth for a unit's motion. "Moving" and "door phase" are
  derived from the state, never stored beside it.
*/
enum class MotionState : std::uint8_t {
  kIdle         = 0,
  kMovingUp     = 1,
  kMovingDown   = 2,
  kDoorsOpening = 3,
  kDoorsOpen    = 4,
  kDoorsClosing = 5,
};

enum class Direction : std::uint8_t {
  kNone = 0,
  kUp   = 1,
  kDown = 2,
};

constexpr bool IsMoving(MotionState state) {
  return state == MotionState::kMovingUp || state == MotionState::kMovingDown;
}

constexpr bool IsDoorPhase(MotionState state) {
  return state == MotionState::kDoorsOpening || state == MotionState::kDoorsOpen || state == MotionState::kDoorsClosing;
}

constexpr MotionState MovingStateFor(Direction direction) {
  return direction == Direction::kDown ? MotionState::kMovingDown : MotionState::kMovingUp;
}

constexpr Direction DirectionBetween(int from_floor, int to_floor) {
  if (to_floor > from_floor) {
    return Direction::kUp;
  }
  if (to_floor < from_floor) {
    return Direction::kDown;
  }
  return Direction::kNone;
}

/*
  Allowed transitions of the per-unit state machine:

    idle           -> moving_up | moving_down | doors_opening
    moving_*       -> moving_* (same direction) | doors_opening | idle
    doors_opening  -> doors_open
    doors_open     -> doors_closing
    doors_closing  -> idle

  Any state may drop to idle when the engine heals an inconsistency; that path
  bypasses this table on purpose and is logged separately.
*/
constexpr bool CanTransition(MotionState from, MotionState to) {
  switch (from) {
    case MotionState::kIdle:
      return to == MotionState::kIdle || IsMoving(to) || to == MotionState::kDoorsOpening;
    case MotionState::kMovingUp:
    case MotionState::kMovingDown:
      return to == from || to == MotionState::kDoorsOpening || to == MotionState::kIdle;
    case MotionState::kDoorsOpening:
      return to == MotionState::kDoorsOpen;
    case MotionState::kDoorsOpen:
      return to == MotionState::kDoorsClosing;
    case MotionState::kDoorsClosing:
      return to == MotionState::kIdle;
  }
  return false;
}

constexpr std::string_view ToString(MotionState state) {
  switch (state) {
    case MotionState::kIdle:
      return "idle";
    case MotionState::kMovingUp:
      return "moving_up";
    case MotionState::kMovingDown:
      return "moving_down";
    case MotionState::kDoorsOpening:
      return "doors_opening";
    case MotionState::kDoorsOpen:
      return "doors_open";
    case MotionState::kDoorsClosing:
      return "doors_closing";
  }
  return "idle";
}

constexpr std::string_view ToString(Direction direction) {
  switch (direction) {
    case Direction::kUp:
      return "up";
    case Direction::kDown:
      return "down";
    case Direction::kNone:
    default:
      return "none";
  }
}

constexpr std::optional<MotionState> ParseMotionState(std::string_view value) {
  for (auto state : {MotionState::kIdle, MotionState::kMovingUp, MotionState::kMovingDown, MotionState::kDoorsOpening, MotionState::kDoorsOpen,
                     MotionState::kDoorsClosing}) {
    if (ToString(state) == value) {
      return state;
    }
  }
  return std::nullopt;
}

constexpr Direction ParseDirection(std::string_view value) {
  if (value == "up") {
    return Direction::kUp;
  }
  if (value == "down") {
    return Direction::kDown;
  }
  return Direction::kNone;
}

} // namespace elevator::model
