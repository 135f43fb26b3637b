#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "elevator/v1.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"
#include "support/engine_fixture.hpp"
#include "support/failing_repository.hpp"

namespace {

using elevator::testing::EngineFixture;

elevator::service::ServiceContext BuildServiceContext(EngineFixture& f) {
  elevator::service::ServiceContext ctx;
  ctx.manager = f.manager;
  ctx.events  = f.events;
  return ctx;
}

void TestErrorMapping() {
  using elevator::grpc::ToStatus;
  assert(ToStatus(elevator::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(elevator::util::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(elevator::util::ConfigurationError("empty")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(elevator::util::ValidationError("bad")).error_message() == "bad");
}

void TestInvalidCallReturnsInvalidArgument() {
  EngineFixture                  f;
  elevator::grpc::DispatchServer server(std::make_shared<elevator::service::DispatchService>(BuildServiceContext(f)));

  elevator::v1::CallRequest req;
  req.set_from_floor(3);
  req.set_to_floor(3);
  elevator::v1::CallResponse resp;
  ::grpc::ServerContext      grpc_ctx;

  const auto status = server.Call(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "From floor and to floor cannot be the same.");
}

void TestCallAndStatusRoundTrip() {
  EngineFixture                  f(2);
  elevator::grpc::DispatchServer server(std::make_shared<elevator::service::DispatchService>(BuildServiceContext(f)));

  elevator::v1::CallRequest req;
  req.set_from_floor(1);
  req.set_to_floor(4);
  elevator::v1::CallResponse resp;
  ::grpc::ServerContext      call_ctx;
  assert(server.Call(&call_ctx, &req, &resp).ok());
  assert(resp.elevator_id() == "elevator-1");
  assert(resp.estimated_seconds() == 19.0);

  elevator::v1::GetStatusRequest  status_req;
  elevator::v1::GetStatusResponse status_resp;
  ::grpc::ServerContext           status_ctx;
  assert(server.GetStatus(&status_ctx, &status_req, &status_resp).ok());
  assert(status_resp.elevators_size() == 2);

  const auto& first = status_resp.elevators(0);
  assert(first.id() == "elevator-1");
  assert(first.state() == elevator::v1::MOTION_STATE_MOVING_UP);
  assert(first.direction() == elevator::v1::DIRECTION_UP);
  assert(first.is_moving());
  assert(first.movement_active());
  assert(first.target_floor() == 4);
  assert(first.pending_stops_size() == 1 && first.pending_stops(0) == 4);

  const auto& second = status_resp.elevators(1);
  assert(second.state() == elevator::v1::MOTION_STATE_IDLE);
  assert(second.target_floor() == 0);
  assert(!second.movement_active());
}

void TestUnknownUnitReturnsNotFound() {
  EngineFixture                  f;
  elevator::grpc::DispatchServer server(std::make_shared<elevator::service::DispatchService>(BuildServiceContext(f)));

  elevator::v1::GetStatusRequest req;
  req.set_elevator_id("elevator-42");
  elevator::v1::GetStatusResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  assert(server.GetStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestListEventsNewestFirst() {
  EngineFixture                  f;
  elevator::grpc::DispatchServer server(std::make_shared<elevator::service::DispatchService>(BuildServiceContext(f)));

  f.manager->AcceptCall(1, 2);
  f.scheduler->RunAll();

  elevator::v1::ListEventsRequest req;
  req.set_elevator_id("elevator-1");
  req.set_limit(2);
  elevator::v1::ListEventsResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  assert(server.ListEvents(&grpc_ctx, &req, &resp).ok());
  assert(resp.events_size() == 2);
  assert(resp.events(0).event() == "elevator_idle");
  assert(resp.events(1).event() == "doors_closing");
  assert(resp.events(0).state() == elevator::v1::MOTION_STATE_IDLE);
}

void TestAdminConfigAndStop() {
  EngineFixture               f;
  elevator::grpc::AdminServer server(std::make_shared<elevator::service::AdminService>(BuildServiceContext(f)));

  elevator::v1::UpdateConfigRequest req;
  req.set_floor_move_time_s(1.0);
  elevator::v1::BuildingConfig resp;
  ::grpc::ServerContext        update_ctx;
  assert(server.UpdateConfig(&update_ctx, &req, &resp).ok());
  assert(resp.total_floors() == 10);
  assert(resp.floor_move_time_s() == 1.0);
  assert(resp.door_open_close_time_s() == 2.0);

  elevator::v1::UpdateConfigRequest bad;
  bad.set_total_floors(1);
  ::grpc::ServerContext bad_ctx;
  assert(server.UpdateConfig(&bad_ctx, &bad, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  f.manager->AcceptCall(1, 3);
  google::protobuf::Empty       empty;
  elevator::v1::StopAllResponse stop_resp;
  ::grpc::ServerContext         stop_ctx;
  assert(server.StopAll(&stop_ctx, &empty, &stop_resp).ok());
  assert(stop_resp.cancelled_ticks() == 1);

  ::grpc::ServerContext again_ctx;
  assert(server.StopAll(&again_ctx, &empty, &stop_resp).ok());
  assert(stop_resp.cancelled_ticks() == 0);
}

void TestWatchDeliversSnapshotThenUpdates() {
  EngineFixture                     f(2);
  elevator::service::DispatchService service(BuildServiceContext(f));

  elevator::v1::WatchRequest req;
  req.set_include_snapshot(true);
  std::vector<elevator::v1::WatchResponse> snapshot;
  auto                                     subscription = service.OpenWatch(req, &snapshot);

  assert(snapshot.size() == 2);
  assert(snapshot[0].has_elevator() && snapshot[0].elevator().id() == "elevator-1");

  f.manager->AcceptCall(1, 2);

  bool saw_called = false;
  while (auto update = service.NextUpdate(*subscription, std::chrono::milliseconds(0))) {
    if (update->has_event() && update->event().event() == "elevator_called") saw_called = true;
    assert(update->dropped_updates() == 0);
  }
  assert(saw_called);

  service.CloseWatch(subscription);
  assert(subscription->Closed());
  assert(f.events->SubscriberCount() == 0);
}

void TestFailedSnapshotReleasesSubscription() {
  auto          repo = std::make_shared<elevator::testing::FailingRepository>();
  EngineFixture f(2, {}, repo);
  elevator::service::DispatchService service(BuildServiceContext(f));

  repo->fail_reads = true;
  elevator::v1::WatchRequest req;
  req.set_include_snapshot(true);
  std::vector<elevator::v1::WatchResponse> snapshot;

  bool threw = false;
  try {
    service.OpenWatch(req, &snapshot);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.events->SubscriberCount() == 0);

  // a watch without snapshot needs no fleet read
  auto subscription = service.OpenWatch(elevator::v1::WatchRequest{}, &snapshot);
  assert(snapshot.empty());
  assert(f.events->SubscriberCount() == 1);
  service.CloseWatch(subscription);
}

} // namespace

int main() {
  TestErrorMapping();
  TestInvalidCallReturnsInvalidArgument();
  TestCallAndStatusRoundTrip();
  TestUnknownUnitReturnsNotFound();
  TestListEventsNewestFirst();
  TestAdminConfigAndStop();
  TestWatchDeliversSnapshotThenUpdates();
  TestFailedSnapshotReleasesSubscription();

  std::cout << "elevator_unit_grpc_status: pass\n";
  return 0;
}
