#include "dispatch_server.hpp"

#include <chrono>
#include <vector>

#include "grpc_error.hpp"

namespace elevator::grpc {

namespace {

constexpr std::chrono::milliseconds kWatchPollInterval{250};

} // namespace

DispatchServer::DispatchServer(std::shared_ptr<elevator::service::DispatchService> svc) : service_(std::move(svc)) {
}

::grpc::Status DispatchServer::Call(::grpc::ServerContext*, const elevator::v1::CallRequest* req, elevator::v1::CallResponse* resp) {
  try {
    *resp = service_->Call(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::GetStatus(::grpc::ServerContext*, const elevator::v1::GetStatusRequest* req, elevator::v1::GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::ListEvents(::grpc::ServerContext*, const elevator::v1::ListEventsRequest* req, elevator::v1::ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Watch(::grpc::ServerContext* ctx, const elevator::v1::WatchRequest* req, ::grpc::ServerWriter<elevator::v1::WatchResponse>* writer) {
  std::shared_ptr<notify::Subscription> subscription;
  try {
    std::vector<elevator::v1::WatchResponse> snapshot;
    subscription = service_->OpenWatch(*req, &snapshot);

    for (const auto& resp : snapshot) {
      if (!writer->Write(resp)) {
        service_->CloseWatch(subscription);
        return ::grpc::Status::OK;
      }
    }

    while (!ctx->IsCancelled() && !subscription->Closed()) {
      auto resp = service_->NextUpdate(*subscription, kWatchPollInterval);
      if (resp && !writer->Write(*resp)) {
        break;
      }
    }

    service_->CloseWatch(subscription);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    if (subscription) {
      service_->CloseWatch(subscription);
    }
    return ToStatus(e);
  }
}

} // namespace elevator::grpc
