#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "elevator/v1.hpp"

using namespace elevator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  elevatorctl <addr> call <from_floor> <to_floor> [requested_by]\n"
            << "  elevatorctl <addr> status [elevator_id]\n"
            << "  elevatorctl <addr> logs [elevator_id] [limit]\n"
            << "  elevatorctl <addr> config\n"
            << "  elevatorctl <addr> set-config [floors=N] [move=S] [door=S]\n"
            << "  elevatorctl <addr> stop\n"
            << "  elevatorctl <addr> watch [--snapshot]\n";
}

static std::optional<int> ParseInt(const std::string& value) {
  try {
    size_t    pos    = 0;
    const int parsed = std::stoi(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<double> ParseDouble(const std::string& value) {
  try {
    size_t       pos    = 0;
    const double parsed = std::stod(value, &pos);
    if (pos != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::string FloorText(int32_t floor) {
  return floor == 0 ? "-" : std::to_string(floor);
}

static void PrintElevator(const Elevator& e) {
  std::cout << e.id() << " floor=" << e.current_floor() << " target=" << FloorText(e.target_floor())
            << " state=" << MotionState_Name(e.state()) << " direction=" << Direction_Name(e.direction())
            << " moving=" << (e.is_moving() ? "yes" : "no") << " active=" << (e.movement_active() ? "yes" : "no") << " stops=[";
  for (int i = 0; i < e.pending_stops_size(); ++i) {
    if (i > 0) std::cout << ",";
    std::cout << e.pending_stops(i);
  }
  std::cout << "]\n";
}

static void PrintEvent(const ElevatorEvent& ev) {
  std::cout << google::protobuf::util::TimeUtil::ToString(ev.timestamp()) << " " << ev.elevator_id() << " " << ev.event() << " " << FloorText(ev.from_floor()) << "->"
            << FloorText(ev.to_floor()) << " state=" << MotionState_Name(ev.state());
  if (!ev.details().empty()) std::cout << " " << ev.details();
  std::cout << "\n";
}

static void PrintConfig(const BuildingConfig& c) {
  std::cout << "total_floors=" << c.total_floors() << "\n";
  std::cout << "floor_move_time_s=" << c.floor_move_time_s() << "\n";
  std::cout << "door_open_close_time_s=" << c.door_open_close_time_s() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto dispatch_stub = ElevatorDispatchService::NewStub(channel);
  auto admin_stub    = ElevatorAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "call") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto from = ParseInt(argv[3]);
    auto to   = ParseInt(argv[4]);
    if (!from || !to) {
      std::cerr << "floors must be integers\n";
      return 1;
    }

    CallRequest req;
    req.set_from_floor(*from);
    req.set_to_floor(*to);
    if (argc >= 6) req.set_requested_by(argv[5]);

    CallResponse resp;

    auto status = dispatch_stub->Call(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "elevator=" << resp.elevator_id() << "\n";
    std::cout << "estimated_seconds=" << resp.estimated_seconds() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusRequest req;
    if (argc >= 4) req.set_elevator_id(argv[3]);

    GetStatusResponse resp;

    auto status = dispatch_stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& e : resp.elevators()) PrintElevator(e);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    ListEventsRequest req;
    if (argc >= 4) req.set_elevator_id(argv[3]);
    if (argc >= 5) {
      auto limit = ParseInt(argv[4]);
      if (!limit || *limit < 0) {
        std::cerr << "limit must be a non-negative integer\n";
        return 1;
      }
      req.set_limit(static_cast<uint32_t>(*limit));
    }

    ListEventsResponse resp;

    auto status = dispatch_stub->ListEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& ev : resp.events()) PrintEvent(ev);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "config") {
    GetConfigRequest req;
    BuildingConfig   resp;

    auto status = admin_stub->GetConfig(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintConfig(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-config") {
    UpdateConfigRequest req;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos) {
        std::cerr << "expected key=value, got '" << arg << "'\n";
        return 1;
      }
      const std::string key   = arg.substr(0, eq);
      const std::string value = arg.substr(eq + 1);

      if (key == "floors") {
        auto parsed = ParseInt(value);
        if (!parsed) {
          std::cerr << "floors must be an integer\n";
          return 1;
        }
        req.set_total_floors(*parsed);
      } else if (key == "move" || key == "door") {
        auto parsed = ParseDouble(value);
        if (!parsed) {
          std::cerr << key << " must be a number of seconds\n";
          return 1;
        }
        if (key == "move") {
          req.set_floor_move_time_s(*parsed);
        } else {
          req.set_door_open_close_time_s(*parsed);
        }
      } else {
        std::cerr << "unknown setting: " << key << "\n";
        return 1;
      }
    }

    BuildingConfig resp;

    auto status = admin_stub->UpdateConfig(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintConfig(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    google::protobuf::Empty req;
    StopAllResponse         resp;

    auto status = admin_stub->StopAll(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "stopped cancelled_ticks=" << resp.cancelled_ticks() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    WatchRequest req;
    req.set_include_snapshot(argc >= 4 && std::string(argv[3]) == "--snapshot");

    auto reader = dispatch_stub->Watch(&ctx, req);

    WatchResponse resp;
    while (reader->Read(&resp)) {
      if (resp.dropped_updates() > 0) {
        std::cout << "(dropped " << resp.dropped_updates() << " updates)\n";
      }
      if (resp.has_elevator()) PrintElevator(resp.elevator());
      if (resp.has_event()) PrintEvent(resp.event());
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
