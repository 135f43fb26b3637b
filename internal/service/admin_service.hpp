#pragma once

#include <google/protobuf/empty.pb.h>

#include "elevator/v1.hpp"
#include "service_context.hpp"

namespace elevator::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  elevator::v1::BuildingConfig GetConfig(const elevator::v1::GetConfigRequest& req);

  elevator::v1::BuildingConfig UpdateConfig(const elevator::v1::UpdateConfigRequest& req);

  elevator::v1::StopAllResponse StopAll(const google::protobuf::Empty& req);

private:
  ServiceContext ctx_;
};

}
