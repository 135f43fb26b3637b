#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/elevator_record.hpp"
#include "internal/db/model/event_record.hpp"

namespace elevator::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Transactions touching disjoint elevator rows may run concurrently;
    backends that cannot do that serialize transactions internally

  The DB is the source of truth for:
    elevator (fleet) state
    the append-only event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Fleet
  // ---------------------------------------------------------------------

  virtual Result InsertElevator(Transaction&, const model::ElevatorRecord&) = 0;

  virtual std::optional<model::ElevatorRecord> GetElevator(Transaction&, const std::string& id) = 0;

  // Ordered by fleet position.
  virtual std::vector<model::ElevatorRecord> ListElevators(Transaction&) = 0;

  // Never changes position; NotFound if the row does not exist.
  virtual Result UpdateElevator(Transaction&, const model::ElevatorRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  virtual Result AppendEvent(Transaction&, const model::EventRecord&) = 0;

  // Newest first; an unset elevator id reads every unit's events.
  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const std::optional<std::string>& elevator_id, uint32_t limit) = 0;
};

} // namespace elevator::db
