#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "elevator/v1/dispatch_service.grpc.pb.h"
#include "internal/service/dispatch_service.hpp"

namespace elevator::grpc {

class DispatchServer final : public elevator::v1::ElevatorDispatchService::Service {
public:
  explicit DispatchServer(std::shared_ptr<elevator::service::DispatchService> svc);

  ::grpc::Status Call(::grpc::ServerContext*,
                    const elevator::v1::CallRequest*,
                    elevator::v1::CallResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*,
                         const elevator::v1::GetStatusRequest*,
                         elevator::v1::GetStatusResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*,
                          const elevator::v1::ListEventsRequest*,
                          elevator::v1::ListEventsResponse*) override;

  ::grpc::Status Watch(::grpc::ServerContext*,
                     const elevator::v1::WatchRequest*,
                     ::grpc::ServerWriter<elevator::v1::WatchResponse>*) override;

private:
  std::shared_ptr<elevator::service::DispatchService> service_;
};

}
