#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "internal/model/stop.hpp"

namespace elevator::core {

/*
  Per-unit FIFO of typed stops.

  Not synchronized; the owning unit slot's mutex guards every call.
  While non-empty, Head()->floor is the unit's target floor.
*/
class StopQueue {
public:
  // Pushes pickup unless current_floor == pickup_floor, then dropoff.
  // Returns the number of stops pushed.
  std::size_t Append(int current_floor, int pickup_floor, int dropoff_floor);

  std::optional<model::Stop> Head() const;

  // Removes the stop the unit just served. Throws util::SimulationInconsistency
  // when the queue is empty or its head is not current_floor.
  model::Stop PopHead(int current_floor);

  // Undoes the newest stop; used when recording a call fails.
  void DropTail() {
    if (!stops_.empty()) stops_.pop_back();
  }

  void Clear() { stops_.clear(); }

  bool        Empty() const { return stops_.empty(); }
  std::size_t Size() const { return stops_.size(); }

  std::vector<model::Stop> Snapshot() const;

private:
  std::deque<model::Stop> stops_;
};

} // namespace elevator::core
