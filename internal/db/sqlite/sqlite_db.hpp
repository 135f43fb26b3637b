#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace elevator::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  The connection is shared by every transaction. A transaction holds
  Lock() for its whole lifetime, so BEGIN/COMMIT pairs never interleave.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace elevator::db::sqlite
