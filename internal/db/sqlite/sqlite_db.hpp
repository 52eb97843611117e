#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/store_options.hpp"

namespace brokerstore::db::sqlite {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Engine failure carrying the sqlite result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around sqlite3*.

  kReadWrite creates the file and switches it to WAL; kReadOnly attaches
  to an existing WAL file so reads run on their own snapshot alongside
  the writer.

  Construction throws util::OpenFailure when the file cannot be opened
  or is not a database.
*/
class SqliteDB {
 public:
  enum class Mode {
    kReadWrite,
    kReadOnly,
  };

  SqliteDB(std::string path, Mode mode, Synchronous synchronous = Synchronous::kNormal);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations); throws SqliteError
  void Exec(const std::string& sql);

  // Prepare a statement, finalized when the pointer goes away
  StatementPtr Prepare(const std::string& sql);

 private:
  // Configure recommended PRAGMAs (WAL, synchronous, busy timeout)
  void Configure(Mode mode, Synchronous synchronous);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace brokerstore::db::sqlite
