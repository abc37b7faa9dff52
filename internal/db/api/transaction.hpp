#pragma once

namespace draft::db {

/*
  Unit of work against the record store.

  Every backend provides:

  - one writer at a time: Begin() blocks while another transaction on the
    same repository is open, including one held by the calling thread
  - reads inside the transaction see its own puts and deletes
  - nothing is visible to the next transaction before Commit()
  - Rollback() and the destructor of an uncommitted transaction discard
    every write

  The engine opens one transaction per operation so a save, its version
  snapshot and its change-log entries land together or not at all.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // no-op after Commit() or a previous Rollback()
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
