#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "elevator/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace elevator::grpc {

class AdminServer final : public elevator::v1::ElevatorAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<elevator::service::AdminService> svc);

  ::grpc::Status GetConfig(::grpc::ServerContext*,
                         const elevator::v1::GetConfigRequest*,
                         elevator::v1::BuildingConfig*) override;

  ::grpc::Status UpdateConfig(::grpc::ServerContext*,
                            const elevator::v1::UpdateConfigRequest*,
                            elevator::v1::BuildingConfig*) override;

  ::grpc::Status StopAll(::grpc::ServerContext*,
                       const google::protobuf::Empty*,
                       elevator::v1::StopAllResponse*) override;

private:
  std::shared_ptr<elevator::service::AdminService> service_;
};

}
