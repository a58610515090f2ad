#pragma once

namespace masterplan::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - One transaction is open per repository at a time; a second Begin()
    blocks until the first one ends, so never nest them on one thread

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy-on-write

  Callers in this service keep transactions short:
  - JobStore: one status/progress change plus its log line
  - ReleaseAssembler: history insert plus the current-release pointer
    flip, so a project is never left pointing at an unrecorded release
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
