#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "elevator/v1.hpp"
#include "internal/notify/event_hub.hpp"
#include "service_context.hpp"

namespace elevator::service {

class DispatchService {
public:
  explicit DispatchService(ServiceContext ctx);

  elevator::v1::CallResponse Call(const elevator::v1::CallRequest& req);

  elevator::v1::GetStatusResponse GetStatus(const elevator::v1::GetStatusRequest& req);

  elevator::v1::ListEventsResponse ListEvents(const elevator::v1::ListEventsRequest& req);

  // Watch: subscribe first so nothing between snapshot and feed is lost.
  std::shared_ptr<notify::Subscription> OpenWatch(const elevator::v1::WatchRequest& req,
                                                  std::vector<elevator::v1::WatchResponse>* snapshot);

  std::optional<elevator::v1::WatchResponse> NextUpdate(notify::Subscription& subscription,
                                                        std::chrono::milliseconds timeout);

  void CloseWatch(const std::shared_ptr<notify::Subscription>& subscription);

private:
  ServiceContext ctx_;
};

}
