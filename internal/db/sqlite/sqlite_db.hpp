#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace draft::db::sqlite {

/*
  Owns the single connection to the draft database file.

  Every transaction runs on this handle; TxMutex() serializes them so
  BEGIN IMMEDIATE never nests. The parent directory of the file is
  created on open.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // pragmas, schema and transaction control
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace draft::db::sqlite
