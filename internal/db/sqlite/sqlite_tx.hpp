#pragma once

#include "sqlite_db.hpp"

namespace brokerstore::db::sqlite {

/*
  SQLite write transaction.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Changes are invisible to readers until Commit(); the destructor rolls
  back anything not committed. Begin/Commit throw SqliteError.
*/
class SqliteTransaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

private:
  SqliteDB& db_;
  bool committed_ = false;
};

}
