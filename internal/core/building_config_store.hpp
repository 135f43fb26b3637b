#pragma once

#include <shared_mutex>

#include "internal/model/building_config.hpp"

namespace elevator::core {

/*
  Current building configuration, readable from any thread.

  Readers take a copy; a movement chain keeps the copy it started with.
*/
class BuildingConfigStore {
public:
  // Throws util::ValidationError for an invalid initial config.
  explicit BuildingConfigStore(model::BuildingConfig initial = {});

  model::BuildingConfig Get() const;

  // Partial merge of update over the current value. Nothing changes unless the
  // merged result validates.
  model::BuildingConfig Merge(const model::BuildingConfigUpdate& update) const;

  void Set(const model::BuildingConfig& config);

  // total_floors >= 2, times finite and >= 0.
  static void Validate(const model::BuildingConfig& config);

private:
  mutable std::shared_mutex mutex_;
  model::BuildingConfig     config_;
};

} // namespace elevator::core
