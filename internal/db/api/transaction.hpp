#pragma once

namespace elevator::db {

/*
  Unit of work against the fleet store and the event log.

  A movement step writes the unit row and its event in one transaction, so
  no reader sees a floor change without the matching event or the reverse.
  Every backend guarantees:

    - writes stay invisible to other transactions until Commit()
    - destroying an uncommitted transaction rolls it back
    - Rollback() after Commit() does nothing

  Memory: private write set, applied under the store mutex by Commit().
  SQLite: BEGIN IMMEDIATE, connection held until destruction.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace elevator::db
