#pragma once

namespace flightline::db {

/*
  Abstract warehouse transaction.

  - Writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() ran

  A transaction is owned by exactly one thread and transactions must
  not be nested on the same thread: memory and sqlite backends hold an
  exclusive lock for the transaction's lifetime.

  SQLite:   BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work on a pooled connection
  Memory:   working copy of the committed state
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() completed
  virtual bool IsFinished() const = 0;
};

} // namespace flightline::db
