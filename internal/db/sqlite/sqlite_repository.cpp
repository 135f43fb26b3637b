#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <string_view>

namespace elevator::db::sqlite {

using elevator::db::ErrorCode;
using elevator::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
};

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindFloor(sqlite3_stmt* st, int idx, int floor) {
    if (floor == 0) {
        sqlite3_bind_null(st, idx);
    } else {
        sqlite3_bind_int(st, idx, floor);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// NULL reads as 0 ("no floor").
int ColFloor(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL ? 0 : sqlite3_column_int(st, col);
}

elevator::model::MotionState ColState(sqlite3_stmt* st, int col) {
    return elevator::model::ParseMotionState(ColText(st, col)).value_or(elevator::model::MotionState::kIdle);
}

elevator::model::Direction ColDirection(sqlite3_stmt* st, int col) {
    return elevator::model::ParseDirection(ColText(st, col));
}

model::ElevatorRecord ReadElevator(sqlite3_stmt* st) {
    model::ElevatorRecord r;
    r.id              = ColText(st, 0);
    r.position        = static_cast<uint32_t>(sqlite3_column_int64(st, 1));
    r.current_floor   = sqlite3_column_int(st, 2);
    r.target_floor    = ColFloor(st, 3);
    r.state           = ColState(st, 4);
    r.direction       = ColDirection(st, 5);
    r.last_updated_ms = ColU64(st, 6);
    return r;
}

constexpr const char* kElevatorColumns = "id,position,current_floor,target_floor,state,direction,last_updated_ms";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Fleet
// ------------------------------------------------------------------

Result SqliteRepository::InsertElevator(Transaction& t, const model::ElevatorRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO elevators(id,position,current_floor,target_floor,state,direction,is_moving,last_updated_ms) "
        "VALUES(?,?,?,?,?,?,?,?);";

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindU64(stmt.st, 2, r.position);
    BindI32(stmt.st, 3, r.current_floor);
    BindFloor(stmt.st, 4, r.target_floor);
    BindText(stmt.st, 5, elevator::model::ToString(r.state));
    BindText(stmt.st, 6, elevator::model::ToString(r.direction));
    BindI32(stmt.st, 7, elevator::model::IsMoving(r.state) ? 1 : 0);
    BindU64(stmt.st, 8, r.last_updated_ms);

    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::ElevatorRecord>
SqliteRepository::GetElevator(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kElevatorColumns + " FROM elevators WHERE id=?;";

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(stmt.st, 1, id);

    if (sqlite3_step(stmt.st) != SQLITE_ROW)
        return std::nullopt;

    return ReadElevator(stmt.st);
}

std::vector<model::ElevatorRecord> SqliteRepository::ListElevators(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kElevatorColumns + " FROM elevators ORDER BY position ASC, id ASC;";

    std::vector<model::ElevatorRecord> out;
    Statement stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        out.push_back(ReadElevator(stmt.st));
    }
    return out;
}

Result SqliteRepository::UpdateElevator(Transaction& t, const model::ElevatorRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE elevators SET current_floor=?,target_floor=?,state=?,direction=?,is_moving=?,last_updated_ms=? WHERE id=?;";

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(stmt.st, 1, r.current_floor);
    BindFloor(stmt.st, 2, r.target_floor);
    BindText(stmt.st, 3, elevator::model::ToString(r.state));
    BindText(stmt.st, 4, elevator::model::ToString(r.direction));
    BindI32(stmt.st, 5, elevator::model::IsMoving(r.state) ? 1 : 0);
    BindU64(stmt.st, 6, r.last_updated_ms);
    BindText(stmt.st, 7, r.id);

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE)
        return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO elevator_events(id,elevator_id,event,from_floor,to_floor,state,direction,timestamp_ms,details) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    Statement stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindText(stmt.st, 2, r.elevator_id);
    BindText(stmt.st, 3, r.event);
    BindFloor(stmt.st, 4, r.from_floor);
    BindFloor(stmt.st, 5, r.to_floor);
    BindText(stmt.st, 6, elevator::model::ToString(r.state));
    BindText(stmt.st, 7, elevator::model::ToString(r.direction));
    BindU64(stmt.st, 8, r.timestamp_ms);
    BindText(stmt.st, 9, r.details);

    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const std::optional<std::string>& elevator_id,
                                                             uint32_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = "SELECT id,elevator_id,event,from_floor,to_floor,state,direction,timestamp_ms,details FROM elevator_events";
    if (elevator_id) sql += " WHERE elevator_id=?";
    sql += " ORDER BY timestamp_ms DESC, seq DESC LIMIT ?;";

    std::vector<model::EventRecord> out;
    Statement stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) != SQLITE_OK)
        return out;

    int idx = 1;
    if (elevator_id) BindText(stmt.st, idx++, *elevator_id);
    BindU64(stmt.st, idx, limit);

    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        model::EventRecord r;
        r.id           = ColText(stmt.st, 0);
        r.elevator_id  = ColText(stmt.st, 1);
        r.event        = ColText(stmt.st, 2);
        r.from_floor   = ColFloor(stmt.st, 3);
        r.to_floor     = ColFloor(stmt.st, 4);
        r.state        = ColState(stmt.st, 5);
        r.direction    = ColDirection(stmt.st, 6);
        r.timestamp_ms = ColU64(stmt.st, 7);
        r.details      = ColText(stmt.st, 8);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace elevator::db::sqlite
