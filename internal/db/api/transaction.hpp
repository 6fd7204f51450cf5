#pragma once

namespace workflow::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Row locks taken through the repository are held until
    Commit()/Rollback()

  SQLite: BEGIN IMMEDIATE, connection held exclusively by the transaction
  Postgres: pqxx::work, SELECT ... FOR UPDATE
  Memory: exclusive store lock + copy-on-write snapshot

  A thread must not hold two transactions on the same repository.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsCommitted() const = 0;
};

} // namespace workflow::db
