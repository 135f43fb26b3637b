#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace elevator::runtime {

namespace {

constexpr std::chrono::seconds kShutdownGrace{2};

} // namespace

Server::Server(std::string bind_address, std::vector<std::shared_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  ELEVATOR_LOG_INFO("elevator dispatch listening", {observability::StringField("bind_address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  grpc_server_.reset();
  ELEVATOR_LOG_INFO("elevator dispatch stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace elevator::runtime
