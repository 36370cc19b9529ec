#pragma once

namespace schedstore::db {

/*
  Which endpoint a transaction runs against.

  Primary is the write endpoint. Replica serves reads and may lag;
  anything that feeds a sequencing decision must use Primary.
  Backends with a single endpoint (sqlite) treat both the same.
*/
enum class ConnectionRole {
  Primary,
  Replica
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Holds exactly one connection for its lifetime
  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed and MUST release
    the connection, on every exit path

  SQLite: BEGIN IMMEDIATE / BEGIN DEFERRED
  Postgres: pqxx::work on a pooled connection
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
