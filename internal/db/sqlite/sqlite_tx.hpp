#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace draft::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT span on the shared connection.

  Holds SqliteDB::TxMutex() from construction until Commit() or
  Rollback(), so statements from two transactions never interleave on
  the connection. An unfinished transaction rolls back in the destructor.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
