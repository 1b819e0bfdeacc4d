#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace streamgate::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction of a SqliteRepository;
  TxMutex() serializes them inside the process, the database write lock
  (BEGIN IMMEDIATE) serializes them across processes.
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

  // Execute a SQL string (pragmas, migrations, transaction control)
  void Exec(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // WAL, foreign keys, busy timeout
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement owned for one execution.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(const sql::Params& params);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  bool        IsNull(int col) const;
  int64_t     Int64(int col) const;
  std::string Text(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace streamgate::db::sqlite
