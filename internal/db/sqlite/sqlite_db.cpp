#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace brokerstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, Mode mode, Synchronous synchronous) : path_(std::move(path)) {
  const int flags = (mode == Mode::kReadWrite ? SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE : SQLITE_OPEN_READONLY) | SQLITE_OPEN_FULLMUTEX;

  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::OpenFailure(path_ + ": " + msg);
  }

  // sqlite defers reading the file; a non-database file surfaces here
  try {
    Configure(mode, synchronous);
  } catch (const std::runtime_error& e) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::OpenFailure(path_ + ": " + e.what());
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return StatementPtr(stmt, &sqlite3_finalize);
}

void SqliteDB::Configure(Mode mode, Synchronous synchronous) {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  if (mode == Mode::kReadOnly) {
    // forces a read of the header so a corrupt file fails at open
    Exec("SELECT count(*) FROM sqlite_master;");
    return;
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is durable across process crashes; FULL also across power loss
  Exec(synchronous == Synchronous::kFull ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace brokerstore::db::sqlite
