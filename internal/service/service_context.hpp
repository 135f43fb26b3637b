#pragma once

#include <memory>

namespace elevator::core { class ElevatorManager; }
namespace elevator::notify { class EventHub; }

namespace elevator::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<elevator::core::ElevatorManager> manager;
  std::shared_ptr<elevator::notify::EventHub> events;
};

}
