#pragma once

#include "internal/model/elevator.hpp"
#include "internal/model/event.hpp"

namespace elevator::notify {

/*
  Outbound change feed. The movement engine calls it after every committed
  tick; implementations must not block on slow observers.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void PublishElevatorChanged(const model::Elevator& elevator) = 0;
  virtual void PublishEvent(const model::ElevatorEvent& event) = 0;
};

} // namespace elevator::notify
