#pragma once

#include <cstdint>
#include <string_view>

namespace elevator::model {

enum class StopKind : std::uint8_t {
  kPickup  = 0,
  kDropoff = 1,
};

struct Stop {
  StopKind kind  = StopKind::kDropoff;
  int      floor = 0;
};

constexpr std::string_view ToString(StopKind kind) {
  return kind == StopKind::kPickup ? "pickup" : "dropoff";
}

} // namespace elevator::model
