#pragma once

#include <memory>
#include <string>

#include "internal/core/building_config_store.hpp"
#include "internal/core/elevator_manager.hpp"
#include "internal/core/movement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/event_hub.hpp"
#include "manual_tick_scheduler.hpp"

namespace elevator::testing {

struct EngineFixture {
  explicit EngineFixture(uint32_t fleet_size = 1, model::BuildingConfig building = {},
                         std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>())
      : repository(std::move(repo)),
        events(std::make_shared<notify::EventHub>()),
        scheduler(std::make_shared<ManualTickScheduler>()),
        config(std::make_shared<core::BuildingConfigStore>(building)),
        engine(std::make_shared<core::MovementEngine>(repository, events, scheduler, config)),
        manager(std::make_shared<core::ElevatorManager>(repository, engine, config)) {
    manager->InitializeFleet(fleet_size, "elevator-");
  }

  model::Elevator Unit(const std::string& id = "elevator-1") {
    return manager->CurrentState(id).elevator;
  }

  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<notify::EventHub>          events;
  std::shared_ptr<ManualTickScheduler>       scheduler;
  std::shared_ptr<core::BuildingConfigStore> config;
  std::shared_ptr<core::MovementEngine>      engine;
  std::shared_ptr<core::ElevatorManager>     manager;
};

} // namespace elevator::testing
