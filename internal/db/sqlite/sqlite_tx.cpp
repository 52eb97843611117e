#include "sqlite_tx.hpp"

namespace brokerstore::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  // sqlite may already have rolled back on its own after an error
  if (!committed_ && !sqlite3_get_autocommit(db_.Handle())) {
    try {
      db_.Exec("ROLLBACK;");
    } catch (const SqliteError&) {
      // destructor must not throw; the next BEGIN reports a wedged connection
    }
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace brokerstore::db::sqlite
