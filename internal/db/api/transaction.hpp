#pragma once

namespace labelq::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Writers are serialized: a transaction that selects a row and then
    updates it cannot interleave with another writer touching that row

  SQLite: process mutex + BEGIN IMMEDIATE
  Postgres: pqxx::work + row locks (FOR UPDATE)
  Memory: writer lock held for the transaction lifetime, snapshot copy
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
