#include "factory.hpp"

#include <stdexcept>

#include "internal/core/building_config_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#if ELEVATOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace elevator::factory {

std::shared_ptr<db::Repository> BuildRepository(const elevator::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ELEVATOR_DB_SQLITE
    const auto& path = database.sqlite().path();
    if (path.empty()) {
      throw util::ConfigurationError("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    ELEVATOR_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  ELEVATOR_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

model::BuildingConfig ToBuildingConfig(const elevator::runtime::config::BuildingConfig& config) {
  model::BuildingConfig building;
  if (config.has_total_floors()) building.total_floors = config.total_floors();
  if (config.has_floor_move_time_s()) building.floor_move_time_s = config.floor_move_time_s();
  if (config.has_door_open_close_time_s()) building.door_open_close_time_s = config.door_open_close_time_s();
  return building;
}

/*
    Build full application dependency graph
*/
Application Build(const elevator::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto config_store = std::make_shared<core::BuildingConfigStore>(ToBuildingConfig(config.building()));

  app.repository = BuildRepository(config);
  app.events     = std::make_shared<notify::EventHub>();
  app.scheduler  = std::make_shared<scheduler::ThreadTickScheduler>(config.engine().worker_threads());
  app.engine     = std::make_shared<core::MovementEngine>(app.repository, app.events, app.scheduler, config_store);
  app.manager    = std::make_shared<core::ElevatorManager>(app.repository, app.engine, config_store);

  const auto fleet_size = config.fleet().size();
  if (fleet_size == 0) {
    throw util::ConfigurationError("fleet.size must be at least 1");
  }
  app.manager->InitializeFleet(fleet_size, config.fleet().id_prefix());

  app.scheduler->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;
  ctx.events  = app.events;

  auto dispatch_service = std::make_shared<service::DispatchService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_shared<grpc::DispatchServer>(dispatch_service));
  app.grpc_services.push_back(std::make_shared<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace elevator::factory
