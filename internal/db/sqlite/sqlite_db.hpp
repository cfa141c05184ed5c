#pragma once

#include <sqlite3.h>

#include <string>

namespace pipeline::db::sqlite {

/*
  Owns the sqlite3* connection to one state database file.

  Each store opens its own connection. Stores sharing a file take turns
  as writers through BEGIN IMMEDIATE, waiting up to kBusyTimeoutMs for
  the file lock before the transaction reports Conflict.
*/
class SqliteDB {
 public:
  static constexpr int kBusyTimeoutMs = 5000;

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

  // Runs one or more statements without results; throws std::runtime_error.
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace pipeline::db::sqlite
