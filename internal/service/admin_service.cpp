#include "admin_service.hpp"

#include "internal/core/elevator_manager.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace elevator::service {

using namespace elevator::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BuildingConfig AdminService::GetConfig(const GetConfigRequest&) {
  return ObserveRpc("AdminService.GetConfig", [&] { return ToProto(ctx_.manager->GetConfig()); });
}

BuildingConfig AdminService::UpdateConfig(const UpdateConfigRequest& req) {
  return ObserveRpc("AdminService.UpdateConfig", [&] { return ToProto(ctx_.manager->SetConfig(FromProto(req))); });
}

StopAllResponse AdminService::StopAll(const google::protobuf::Empty&) {
  return ObserveRpc("AdminService.StopAll", [&] {
    StopAllResponse resp;
    resp.set_cancelled_ticks(ctx_.manager->StopAll());
    return resp;
  });
}

} // namespace elevator::service
