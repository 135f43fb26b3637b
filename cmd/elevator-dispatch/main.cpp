#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using elevator::factory::Build;
using elevator::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  elevator::observability::ShutdownLogging();
  elevator::observability::ShutdownMetrics();
  elevator::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: elevator-dispatch <config.yaml> OR elevator-dispatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = elevator::config::ConfigLoader::LoadFromYaml(config_path);

    elevator::observability::InitializeTracing(config);
    elevator::observability::InitializeMetrics(config);
    elevator::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), app.grpc_services);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ELEVATOR_LOG_INFO("elevator dispatch started",
                      {elevator::observability::StringField("bind_address", config.server().bind_address()),
                       elevator::observability::IntField("fleet_size", config.fleet().size()),
                       elevator::observability::IntField("total_floors", config.building().total_floors())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ELEVATOR_LOG_INFO("shutting down elevator dispatch");

    server.Stop();
    const auto cancelled = app.manager->StopAll();
    app.scheduler->Shutdown();
    app.events->Shutdown();
    ELEVATOR_LOG_INFO("movement halted", {elevator::observability::IntField("cancelled_ticks", static_cast<int64_t>(cancelled))});

    ShutdownObservability();
  } catch (const std::exception& e) {
    ELEVATOR_LOG_ERROR("fatal error", {elevator::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
