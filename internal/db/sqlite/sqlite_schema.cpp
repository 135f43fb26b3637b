#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace elevator::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS elevators (id TEXT PRIMARY KEY, position INTEGER NOT NULL, current_floor INTEGER NOT NULL DEFAULT 1, "
      "target_floor INTEGER, state TEXT NOT NULL DEFAULT 'idle', direction TEXT NOT NULL DEFAULT 'none', is_moving INTEGER NOT NULL DEFAULT 0, "
      "last_updated_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS elevator_events (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, elevator_id TEXT NOT NULL, "
      "event TEXT NOT NULL, from_floor INTEGER, to_floor INTEGER, state TEXT, direction TEXT, timestamp_ms INTEGER NOT NULL, details TEXT);",
      "CREATE INDEX IF NOT EXISTS elevator_events_by_unit ON elevator_events (elevator_id, timestamp_ms);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,position,current_floor,target_floor,state,direction,is_moving,last_updated_ms FROM elevators LIMIT 1;");
  db.Exec("SELECT seq,id,elevator_id,event,from_floor,to_floor,state,direction,timestamp_ms,details FROM elevator_events LIMIT 1;");
}

} // namespace elevator::db::sqlite
