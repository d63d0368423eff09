#pragma once

namespace flowstead::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A thread must never open a second transaction while it holds one
    (memory and SQLite serialize transactions per database)

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy-on-write under the writer lock
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
