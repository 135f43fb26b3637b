#include "dispatch_service.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/core/elevator_manager.hpp"
#include "internal/observability/logging.hpp"
#include "proto_mapping.hpp"
#include "rpc_observer.hpp"

namespace elevator::service {

using namespace elevator::v1;

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CallResponse DispatchService::Call(const CallRequest& req) {
  return ObserveRpc("DispatchService.Call", [&] {
    const auto result = ctx_.manager->AcceptCall(req.from_floor(), req.to_floor(), req.requested_by());

    CallResponse resp;
    resp.set_elevator_id(result.elevator_id);
    resp.set_estimated_seconds(result.estimated_seconds);
    return resp;
  });
}

GetStatusResponse DispatchService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("DispatchService.GetStatus", [&] {
    GetStatusResponse resp;
    if (!req.elevator_id().empty()) {
      *resp.add_elevators() = ToProto(ctx_.manager->CurrentState(req.elevator_id()));
      return resp;
    }

    for (const auto& status : ctx_.manager->CurrentStates()) {
      *resp.add_elevators() = ToProto(status);
    }
    return resp;
  });
}

ListEventsResponse DispatchService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("DispatchService.ListEvents", [&] {
    std::optional<std::string> elevator_id;
    if (!req.elevator_id().empty()) {
      elevator_id = req.elevator_id();
    }

    ListEventsResponse resp;
    for (const auto& event : ctx_.manager->ListEvents(elevator_id, req.limit())) {
      *resp.add_events() = ToProto(event);
    }
    return resp;
  });
}

std::shared_ptr<notify::Subscription> DispatchService::OpenWatch(const WatchRequest& req, std::vector<WatchResponse>* snapshot) {
  return ObserveRpc("DispatchService.Watch", [&] {
    auto subscription = ctx_.events->Subscribe();

    if (req.include_snapshot() && snapshot) {
      try {
        for (const auto& status : ctx_.manager->CurrentStates()) {
          WatchResponse resp;
          *resp.mutable_elevator() = ToProto(status);
          snapshot->push_back(std::move(resp));
        }
      } catch (const std::exception&) {
        ctx_.events->Unsubscribe(subscription);
        throw;
      }
    }

    ELEVATOR_LOG_INFO("watch opened", {observability::IntField("subscribers", static_cast<int64_t>(ctx_.events->SubscriberCount()))});
    return subscription;
  });
}

std::optional<WatchResponse> DispatchService::NextUpdate(notify::Subscription& subscription, std::chrono::milliseconds timeout) {
  auto update = subscription.Next(timeout);
  if (!update) {
    return std::nullopt;
  }

  WatchResponse resp;
  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, model::Elevator>) {
          *resp.mutable_elevator() = ToProto(value);
        } else {
          *resp.mutable_event() = ToProto(value);
        }
      },
      *update);
  resp.set_dropped_updates(subscription.TakeDropped());
  return resp;
}

void DispatchService::CloseWatch(const std::shared_ptr<notify::Subscription>& subscription) {
  ctx_.events->Unsubscribe(subscription);
  ELEVATOR_LOG_INFO("watch closed", {observability::IntField("subscribers", static_cast<int64_t>(ctx_.events->SubscriberCount()))});
}

} // namespace elevator::service
