#pragma once

namespace offline::db {

/*
  Unit of atomic work against a Durable Store.

  Every Repository write takes the transaction it belongs to. A queue
  status change, a cache write plus its evictions, or a housekeeping pass
  either lands whole or not at all:

  - writes stay private to the transaction until Commit()
  - Rollback(), or destroying an unfinished transaction, drops them
  - a store runs one transaction at a time; Begin() waits for the
    previous one. Never nest transactions on one thread.

  Backends: SQLite uses BEGIN IMMEDIATE, memory publishes a private copy
  of its state on commit.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsFinished() const = 0;
};

} // namespace offline::db
