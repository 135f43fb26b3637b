#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace elevator::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection lock from construction to destruction and uses
  BEGIN IMMEDIATE so the write lock is taken up front.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_ = false;
};

} // namespace elevator::db::sqlite
