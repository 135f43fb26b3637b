#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace elevator::grpc {

AdminServer::AdminServer(std::shared_ptr<elevator::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetConfig(::grpc::ServerContext*, const elevator::v1::GetConfigRequest* req, elevator::v1::BuildingConfig* resp) {
  try {
    *resp = service_->GetConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::UpdateConfig(::grpc::ServerContext*, const elevator::v1::UpdateConfigRequest* req, elevator::v1::BuildingConfig* resp) {
  try {
    *resp = service_->UpdateConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::StopAll(::grpc::ServerContext*, const google::protobuf::Empty* req, elevator::v1::StopAllResponse* resp) {
  try {
    *resp = service_->StopAll(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace elevator::grpc
