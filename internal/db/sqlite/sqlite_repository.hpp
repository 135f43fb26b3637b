#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace elevator::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertElevator(Transaction&, const model::ElevatorRecord&) override;
  std::optional<model::ElevatorRecord> GetElevator(Transaction&, const std::string&) override;
  std::vector<model::ElevatorRecord> ListElevators(Transaction&) override;
  Result UpdateElevator(Transaction&, const model::ElevatorRecord&) override;

  Result AppendEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::optional<std::string>& elevator_id,
                                             uint32_t limit) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace elevator::db::sqlite
