#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <variant>

#include "internal/notify/event_hub.hpp"

namespace {

using elevator::notify::EventHub;
using namespace std::chrono_literals;

elevator::model::Elevator MakeUnit(int floor) {
  elevator::model::Elevator unit;
  unit.id            = "elevator-1";
  unit.current_floor = floor;
  return unit;
}

void TestFanOutToEverySubscriber() {
  EventHub hub;
  auto     first  = hub.Subscribe();
  auto     second = hub.Subscribe();
  assert(hub.SubscriberCount() == 2);

  hub.PublishElevatorChanged(MakeUnit(4));

  elevator::model::ElevatorEvent event;
  event.kind = elevator::model::EventKind::kFloorReached;
  hub.PublishEvent(event);

  for (auto& sub : {first, second}) {
    auto a = sub->Next(10ms);
    assert(a && std::holds_alternative<elevator::model::Elevator>(*a));
    assert(std::get<elevator::model::Elevator>(*a).current_floor == 4);

    auto b = sub->Next(10ms);
    assert(b && std::holds_alternative<elevator::model::ElevatorEvent>(*b));
    assert(!sub->Next(1ms).has_value());
  }
}

void TestSlowSubscriberDropsOldest() {
  EventHub hub(2);
  auto     sub = hub.Subscribe();

  for (int floor = 1; floor <= 5; ++floor) {
    hub.PublishElevatorChanged(MakeUnit(floor));
  }

  assert(sub->TakeDropped() == 3);
  assert(sub->TakeDropped() == 0);
  assert(std::get<elevator::model::Elevator>(*sub->Next(1ms)).current_floor == 4);
  assert(std::get<elevator::model::Elevator>(*sub->Next(1ms)).current_floor == 5);
}

void TestUnsubscribeStopsDelivery() {
  EventHub hub;
  auto     sub = hub.Subscribe();
  hub.Unsubscribe(sub);

  assert(hub.SubscriberCount() == 0);
  assert(sub->Closed());
  hub.PublishElevatorChanged(MakeUnit(2));
  assert(!sub->Next(1ms).has_value());
}

void TestNextWakesOnPublish() {
  EventHub hub;
  auto     sub = hub.Subscribe();

  std::thread publisher([&] {
    std::this_thread::sleep_for(20ms);
    hub.PublishElevatorChanged(MakeUnit(7));
  });

  auto update = sub->Next(5s);
  publisher.join();
  assert(update.has_value());
}

void TestShutdownClosesEverything() {
  EventHub hub;
  auto     sub = hub.Subscribe();
  hub.Shutdown();

  assert(sub->Closed());
  assert(hub.SubscriberCount() == 0);

  auto late = hub.Subscribe();
  assert(late->Closed());
  assert(hub.SubscriberCount() == 0);
}

} // namespace

int main() {
  TestFanOutToEverySubscriber();
  TestSlowSubscriberDropsOldest();
  TestUnsubscribeStopsDelivery();
  TestNextWakesOnPublish();
  TestShutdownClosesEverything();

  std::cout << "elevator_unit_event_hub: pass\n";
  return 0;
}
