#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <vector>

#include "internal/codec/record_codec.hpp"
#include "internal/model/record_ids.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace brokerstore::db::sqlite {

using brokerstore::db::ErrorCode;
using brokerstore::db::Result;

namespace {

constexpr int kSchemaVersion = 1;

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS server_info (id TEXT PRIMARY KEY, body BLOB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS clients (id TEXT PRIMARY KEY, body BLOB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS subscriptions (id TEXT PRIMARY KEY, body BLOB NOT NULL);",
    "CREATE TABLE IF NOT EXISTS messages (kind INTEGER NOT NULL, id TEXT NOT NULL, created INTEGER NOT NULL, body BLOB NOT NULL, PRIMARY KEY (kind, id));",
    "CREATE INDEX IF NOT EXISTS messages_by_kind_created ON messages(kind, created);",
    "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

void BootstrapSchema(SqliteDB& db) {
  SqliteTransaction tx(db);

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  auto st = db.Prepare("INSERT OR IGNORE INTO schema_version(version, applied_at_ms) VALUES(?, ?);");
  sqlite3_bind_int(st.get(), 1, kSchemaVersion);
  sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    throw SqliteError(rc, std::string("schema_version: ") + sqlite3_errmsg(db.Handle()));
  }
  st.reset();

  tx.Commit();
}

Result Translate(int rc, const std::string& msg) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

Result Unavailable() {
  return Result::Err(ErrorCode::StoreUnavailable, "store not open");
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& b) {
  sqlite3_bind_blob(st, idx, b.data(), static_cast<int>(b.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

// body column -> record; Corruption names the offending row
Result DecodeColumn(sqlite3_stmt* st, int col, const std::string& id, google::protobuf::MessageLite* record) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!codec::Decode(data, static_cast<std::size_t>(size), record)) {
    return Result::Err(ErrorCode::Corruption, "undecodable record " + id);
  }
  return Result::Ok();
}

// One statement inside one BEGIN IMMEDIATE ... COMMIT.
template <typename Bind>
Result RunWrite(SqliteDB& db, const char* sql, Bind&& bind) {
  try {
    SqliteTransaction tx(db);

    auto st = db.Prepare(sql);
    bind(st.get());

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
      return Translate(rc, sqlite3_errmsg(db.Handle()));
    }
    st.reset();

    tx.Commit();
    return Result::Ok();
  } catch (const SqliteError& e) {
    return Translate(e.Code(), e.what());
  }
}

template <typename Bind, typename OnRow>
Result RunScan(SqliteDB& db, const char* sql, Bind&& bind, OnRow&& on_row) {
  try {
    auto st = db.Prepare(sql);
    bind(st.get());

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      auto r = on_row(st.get());
      if (!r) return r;
    }
    if (rc != SQLITE_DONE) {
      return Translate(rc, sqlite3_errmsg(db.Handle()));
    }
    return Result::Ok();
  } catch (const SqliteError& e) {
    return Translate(e.Code(), e.what());
  }
}

// id-keyed table scan, decoding every body into T
template <typename T>
Result ReadAll(SqliteDB& db, const char* sql, std::vector<T>& out) {
  out.clear();
  auto r = RunScan(
      db, sql, [](sqlite3_stmt*) {},
      [&out](sqlite3_stmt* st) {
        T record;
        auto decoded = DecodeColumn(st, 1, ColText(st, 0), &record);
        if (!decoded) return decoded;
        out.push_back(std::move(record));
        return Result::Ok();
      });
  if (!r) out.clear();
  return r;
}

} // namespace

SqliteStore::SqliteStore(StoreOptions options)
    : options_(std::move(options)), path_(ResolveStorePath(options_.path)) {}

SqliteStore::~SqliteStore() {
  Close();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

Result SqliteStore::Open() {
  std::unique_lock lock(lifecycle_mu_);
  if (writer_) return Result::Ok();

  try {
    auto file_lock = std::make_unique<lock::FileLock>(path_ + ".lock", options_.lock_timeout);
    auto writer    = std::make_unique<SqliteDB>(path_, SqliteDB::Mode::kReadWrite, options_.synchronous);
    BootstrapSchema(*writer);
    auto reader = std::make_unique<SqliteDB>(path_, SqliteDB::Mode::kReadOnly);

    lock_   = std::move(file_lock);
    writer_ = std::move(writer);
    reader_ = std::move(reader);
  } catch (const util::LockTimeout& e) {
    return Result::Err(ErrorCode::LockTimeout, e.what());
  } catch (const util::OpenFailure& e) {
    return Result::Err(ErrorCode::OpenFailure, e.what());
  } catch (const SqliteError& e) {
    return Result::Err(ErrorCode::OpenFailure, path_ + ": " + e.what());
  }

  BROKERSTORE_LOG_INFO("store opened", {observability::StringField("path", path_),
                                        observability::IntField("lock_timeout_ms", options_.lock_timeout.count())});
  return Result::Ok();
}

void SqliteStore::Close() {
  std::unique_lock lock(lifecycle_mu_);
  if (!writer_) return;

  // last connection out checkpoints the WAL back into the main file
  reader_.reset();
  writer_.reset();
  lock_.reset();

  BROKERSTORE_LOG_INFO("store closed", {observability::StringField("path", path_)});
}

bool SqliteStore::IsOpen() const {
  std::shared_lock lock(lifecycle_mu_);
  return writer_ != nullptr;
}

Result SqliteStore::UpsertBody(const char* sql, const std::string& id, const google::protobuf::MessageLite& record) {
  std::string body;
  if (!codec::Encode(record, &body)) {
    return Result::Err(ErrorCode::InternalError, "cannot encode record " + id);
  }

  std::lock_guard<std::mutex> write(write_mu_);
  return RunWrite(*writer_, sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, id);
    BindBlob(st, 2, body);
  });
}

Result SqliteStore::DeleteById(const char* sql, const std::string& id) {
  std::lock_guard<std::mutex> write(write_mu_);
  return RunWrite(*writer_, sql, [&](sqlite3_stmt* st) { BindText(st, 1, id); });
}

// ------------------------------------------------------------------
// Server info
// ------------------------------------------------------------------

Result SqliteStore::SaveServerInfo(const v1::ServerInfo& info) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();

  v1::ServerInfo record = info;
  record.set_id(model::kServerInfoId);
  record.set_kind(v1::RECORD_KIND_SERVER_INFO);

  return UpsertBody("INSERT INTO server_info(id,body) VALUES(?,?) "
                    "ON CONFLICT(id) DO UPDATE SET body=excluded.body;",
                    record.id(), record);
}

Result SqliteStore::ReadServerInfo(v1::ServerInfo& out) {
  std::shared_lock lock(lifecycle_mu_);
  out.Clear();
  if (!reader_) return Unavailable();

  std::lock_guard<std::mutex> read(read_mu_);

  const std::string id = model::kServerInfoId;

  auto r = RunScan(
      *reader_, "SELECT id,body FROM server_info WHERE id=?;", [&](sqlite3_stmt* st) { BindText(st, 1, id); },
      [&](sqlite3_stmt* st) { return DecodeColumn(st, 1, id, &out); });
  if (!r) out.Clear();
  return r;
}

// ------------------------------------------------------------------
// Clients
// ------------------------------------------------------------------

Result SqliteStore::SaveClient(const v1::Client& client) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();
  if (client.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "client id is empty");

  v1::Client record = client;
  record.set_kind(v1::RECORD_KIND_CLIENT);

  return UpsertBody("INSERT INTO clients(id,body) VALUES(?,?) "
                    "ON CONFLICT(id) DO UPDATE SET body=excluded.body;",
                    record.id(), record);
}

Result SqliteStore::DeleteClient(const std::string& id) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();

  return DeleteById("DELETE FROM clients WHERE id=?;", id);
}

Result SqliteStore::ReadClients(std::vector<v1::Client>& out) {
  std::shared_lock lock(lifecycle_mu_);
  out.clear();
  if (!reader_) return Unavailable();

  std::lock_guard<std::mutex> read(read_mu_);

  return ReadAll(*reader_, "SELECT id,body FROM clients;", out);
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteStore::SaveSubscription(const v1::Subscription& sub) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();
  if (sub.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "subscription id is empty");

  v1::Subscription record = sub;
  record.set_kind(v1::RECORD_KIND_SUBSCRIPTION);

  return UpsertBody("INSERT INTO subscriptions(id,body) VALUES(?,?) "
                    "ON CONFLICT(id) DO UPDATE SET body=excluded.body;",
                    record.id(), record);
}

Result SqliteStore::DeleteSubscription(const std::string& id) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();

  return DeleteById("DELETE FROM subscriptions WHERE id=?;", id);
}

Result SqliteStore::ReadSubscriptions(std::vector<v1::Subscription>& out) {
  std::shared_lock lock(lifecycle_mu_);
  out.clear();
  if (!reader_) return Unavailable();

  std::lock_guard<std::mutex> read(read_mu_);

  return ReadAll(*reader_, "SELECT id,body FROM subscriptions;", out);
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteStore::SaveMessage(v1::RecordKind kind, const v1::Message& message) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");
  if (message.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "message id is empty");

  v1::Message record = message;
  record.set_kind(kind);

  std::string body;
  if (!codec::Encode(record, &body)) {
    return Result::Err(ErrorCode::InternalError, "cannot encode message " + record.id());
  }

  std::lock_guard<std::mutex> write(write_mu_);
  return RunWrite(*writer_,
                  "INSERT INTO messages(kind,id,created,body) VALUES(?,?,?,?) "
                  "ON CONFLICT(kind,id) DO UPDATE SET created=excluded.created, body=excluded.body;",
                  [&](sqlite3_stmt* st) {
                    sqlite3_bind_int(st, 1, static_cast<int>(kind));
                    BindText(st, 2, record.id());
                    sqlite3_bind_int64(st, 3, static_cast<sqlite3_int64>(record.created()));
                    BindBlob(st, 4, body);
                  });
}

Result SqliteStore::DeleteMessage(v1::RecordKind kind, const std::string& id) {
  std::shared_lock lock(lifecycle_mu_);
  if (!writer_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");

  std::lock_guard<std::mutex> write(write_mu_);
  return RunWrite(*writer_, "DELETE FROM messages WHERE kind=? AND id=?;", [&](sqlite3_stmt* st) {
    sqlite3_bind_int(st, 1, static_cast<int>(kind));
    BindText(st, 2, id);
  });
}

Result SqliteStore::FindMessagesByKind(v1::RecordKind kind, std::vector<v1::Message>& out) {
  std::shared_lock lock(lifecycle_mu_);
  out.clear();
  if (!reader_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");

  std::lock_guard<std::mutex> read(read_mu_);

  auto r = RunScan(
      *reader_, "SELECT id,body FROM messages WHERE kind=?;",
      [&](sqlite3_stmt* st) { sqlite3_bind_int(st, 1, static_cast<int>(kind)); },
      [&](sqlite3_stmt* st) {
        v1::Message m;
        auto decoded = DecodeColumn(st, 1, ColText(st, 0), &m);
        if (!decoded) return decoded;
        out.push_back(std::move(m));
        return Result::Ok();
      });
  if (!r) out.clear();
  return r;
}

} // namespace brokerstore::db::sqlite
