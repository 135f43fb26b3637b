#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace elevator::db::sqlite {

/*
  Creates the fleet and event-log tables if missing and checks the expected
  columns so a stale database file fails at startup instead of mid-tick.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace elevator::db::sqlite
