#pragma once

namespace streamgate::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Conditional writes issued inside one transaction are serialized
    against every other writer (ChargeCredits, payment CAS, section
    registration rely on this)

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: repository lock held for the transaction lifetime + undo journal
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() completed
  virtual bool IsCommitted() const = 0;
};

} // namespace streamgate::db
