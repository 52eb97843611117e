#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "internal/db/api/store.hpp"
#include "internal/db/api/store_options.hpp"
#include "internal/db/lock/file_lock.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace brokerstore::db::sqlite {

/*
  Durable store on a single SQLite file.

  One table per record kind; inflight and retained messages share the
  messages table, keyed (kind, id) and indexed on (kind, created).

  Writes run on one connection, one transaction per call, serialized by
  write_mu_. Reads run on a second read-only connection, serialized by
  read_mu_, so they see a committed WAL snapshot and never a writer's
  open transaction.
*/
class SqliteStore final : public db::Store {
public:
  explicit SqliteStore(StoreOptions options);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&)            = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  Result Open() override;
  void Close() override;
  bool IsOpen() const override;

  Result SaveServerInfo(const v1::ServerInfo&) override;
  Result ReadServerInfo(v1::ServerInfo& out) override;

  Result SaveClient(const v1::Client&) override;
  Result DeleteClient(const std::string& id) override;
  Result ReadClients(std::vector<v1::Client>& out) override;

  Result SaveSubscription(const v1::Subscription&) override;
  Result DeleteSubscription(const std::string& id) override;
  Result ReadSubscriptions(std::vector<v1::Subscription>& out) override;

  Result SaveMessage(v1::RecordKind kind, const v1::Message&) override;
  Result DeleteMessage(v1::RecordKind kind, const std::string& id) override;
  Result FindMessagesByKind(v1::RecordKind kind, std::vector<v1::Message>& out) override;

  const std::string& Path() const { return path_; }

private:
  // id-keyed tables (server_info, clients, subscriptions)
  Result UpsertBody(const char* sql, const std::string& id, const google::protobuf::MessageLite& record);
  Result DeleteById(const char* sql, const std::string& id);

  StoreOptions options_;
  std::string  path_;

  // shared for operations, exclusive for Open/Close
  mutable std::shared_mutex lifecycle_mu_;
  std::mutex                write_mu_;
  std::mutex                read_mu_;

  std::unique_ptr<lock::FileLock> lock_;
  std::unique_ptr<SqliteDB>       writer_;
  std::unique_ptr<SqliteDB>       reader_;
};

}
