#include "stop_queue.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace elevator::core {

std::size_t StopQueue::Append(int current_floor, int pickup_floor, int dropoff_floor) {
  std::size_t pushed = 0;
  if (current_floor != pickup_floor) {
    stops_.push_back({model::StopKind::kPickup, pickup_floor});
    ++pushed;
  }
  stops_.push_back({model::StopKind::kDropoff, dropoff_floor});
  return pushed + 1;
}

std::optional<model::Stop> StopQueue::Head() const {
  if (stops_.empty()) return std::nullopt;
  return stops_.front();
}

model::Stop StopQueue::PopHead(int current_floor) {
  if (stops_.empty()) {
    throw util::SimulationInconsistency("stop queue empty at floor " + std::to_string(current_floor));
  }

  const auto head = stops_.front();
  if (head.floor != current_floor) {
    throw util::SimulationInconsistency("stop queue head " + std::to_string(head.floor) + " does not match floor " + std::to_string(current_floor));
  }

  stops_.pop_front();
  return head;
}

std::vector<model::Stop> StopQueue::Snapshot() const {
  return {stops_.begin(), stops_.end()};
}

} // namespace elevator::core
