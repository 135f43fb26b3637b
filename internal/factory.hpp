#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/elevator_manager.hpp"
#include "internal/core/movement_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/event_hub.hpp"
#include "internal/scheduler/thread_tick_scheduler.hpp"

namespace elevator::factory {

/*
  Application

  Owns every long-lived component of the server. Shutdown order is
  manager->StopAll(), scheduler->Shutdown(), events->Shutdown().
*/
struct Application {
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<scheduler::ThreadTickScheduler> scheduler;
  std::shared_ptr<notify::EventHub>               events;
  std::shared_ptr<core::MovementEngine>           engine;
  std::shared_ptr<core::ElevatorManager>          manager;
};

/*
  Build

  Composition root. The only place that knows concrete repository and
  scheduler types. Seeds or recovers the fleet and starts the tick workers.
*/
Application Build(const elevator::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const elevator::runtime::config::RuntimeConfig& config);

model::BuildingConfig ToBuildingConfig(const elevator::runtime::config::BuildingConfig& config);

} // namespace elevator::factory
