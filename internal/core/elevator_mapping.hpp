#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/elevator_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/model/elevator.hpp"
#include "internal/model/event.hpp"

namespace elevator::core {

// Converts a failed db::Result into the matching util exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

model::Elevator           ToElevator(const db::model::ElevatorRecord& record);
db::model::ElevatorRecord ToElevatorRecord(const model::Elevator& elevator, uint32_t position = 0);

model::ElevatorEvent   ToEvent(const db::model::EventRecord& record);
db::model::EventRecord ToEventRecord(const model::ElevatorEvent& event);

} // namespace elevator::core
