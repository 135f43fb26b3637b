#include <cassert>
#include <iostream>

#include "internal/core/stop_queue.hpp"
#include "internal/util/errors.hpp"

namespace {

using elevator::core::StopQueue;
using elevator::model::StopKind;

void TestAppendPushesPickupThenDropoff() {
  StopQueue queue;
  assert(queue.Append(1, 3, 7) == 2);

  const auto stops = queue.Snapshot();
  assert(stops.size() == 2);
  assert(stops[0].kind == StopKind::kPickup && stops[0].floor == 3);
  assert(stops[1].kind == StopKind::kDropoff && stops[1].floor == 7);
  assert(queue.Head()->floor == 3);
}

void TestAppendSkipsPickupAtCurrentFloor() {
  StopQueue queue;
  assert(queue.Append(4, 4, 2) == 1);
  assert(queue.Size() == 1);
  assert(queue.Head()->kind == StopKind::kDropoff);
  assert(queue.Head()->floor == 2);
}

void TestCallsAreServedInArrivalOrder() {
  StopQueue queue;
  queue.Append(1, 5, 2);
  queue.Append(1, 3, 9);

  const auto stops = queue.Snapshot();
  assert(stops.size() == 4);
  assert(stops[0].floor == 5 && stops[1].floor == 2 && stops[2].floor == 3 && stops[3].floor == 9);
}

void TestPopHeadRequiresMatchingFloor() {
  StopQueue queue;
  queue.Append(1, 3, 7);

  bool threw = false;
  try {
    queue.PopHead(4);
  } catch (const elevator::util::SimulationInconsistency&) {
    threw = true;
  }
  assert(threw);
  assert(queue.Size() == 2);

  const auto served = queue.PopHead(3);
  assert(served.kind == StopKind::kPickup);
  assert(queue.Head()->floor == 7);
}

void TestPopHeadOnEmptyThrows() {
  StopQueue queue;
  bool      threw = false;
  try {
    queue.PopHead(1);
  } catch (const elevator::util::SimulationInconsistency&) {
    threw = true;
  }
  assert(threw);
  assert(!queue.Head().has_value());
}

void TestDropTailAndClear() {
  StopQueue queue;
  queue.Append(1, 2, 6);
  queue.Append(1, 8, 4);

  queue.DropTail();
  queue.DropTail();
  assert(queue.Size() == 2);
  assert(queue.Snapshot()[1].floor == 6);

  queue.Clear();
  assert(queue.Empty());
  queue.DropTail();
  assert(queue.Empty());
}

} // namespace

int main() {
  TestAppendPushesPickupThenDropoff();
  TestAppendSkipsPickupAtCurrentFloor();
  TestCallsAreServedInArrivalOrder();
  TestPopHeadRequiresMatchingFloor();
  TestPopHeadOnEmptyThrows();
  TestDropTailAndClear();

  std::cout << "elevator_unit_stop_queue: pass\n";
  return 0;
}
