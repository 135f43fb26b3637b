#pragma once

#include <optional>

namespace elevator::model {

struct BuildingConfig {
  int    total_floors           = 10;
  double floor_move_time_s      = 5.0;
  double door_open_close_time_s = 2.0;
};

/*
  Partial update. Unset fields keep their current value.
*/
struct BuildingConfigUpdate {
  std::optional<int>    total_floors;
  std::optional<double> floor_move_time_s;
  std::optional<double> door_open_close_time_s;
};

} // namespace elevator::model
