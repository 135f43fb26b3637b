#include "building_config_store.hpp"

#include <cmath>
#include <mutex>
#include <string>

#include "internal/util/errors.hpp"

namespace elevator::core {

namespace {

void ValidateSeconds(double value, const char* name) {
  if (!std::isfinite(value) || value < 0) {
    throw util::ValidationError(std::string(name) + " must be a non-negative number of seconds");
  }
}

} // namespace

BuildingConfigStore::BuildingConfigStore(model::BuildingConfig initial) : config_(initial) {
  Validate(config_);
}

model::BuildingConfig BuildingConfigStore::Get() const {
  std::shared_lock lock(mutex_);
  return config_;
}

model::BuildingConfig BuildingConfigStore::Merge(const model::BuildingConfigUpdate& update) const {
  auto merged = Get();
  if (update.total_floors) merged.total_floors = *update.total_floors;
  if (update.floor_move_time_s) merged.floor_move_time_s = *update.floor_move_time_s;
  if (update.door_open_close_time_s) merged.door_open_close_time_s = *update.door_open_close_time_s;
  Validate(merged);
  return merged;
}

void BuildingConfigStore::Set(const model::BuildingConfig& config) {
  Validate(config);
  std::unique_lock lock(mutex_);
  config_ = config;
}

void BuildingConfigStore::Validate(const model::BuildingConfig& config) {
  if (config.total_floors < 2) {
    throw util::ValidationError("totalFloors must be at least 2");
  }
  ValidateSeconds(config.floor_move_time_s, "floorMoveTime");
  ValidateSeconds(config.door_open_close_time_s, "doorOpenCloseTime");
}

} // namespace elevator::core
