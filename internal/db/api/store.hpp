#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "brokerstore/v1.hpp"
#include "internal/db/api/result.hpp"

namespace brokerstore::db {

/*
  Indexed store abstraction.

  CRITICAL GUARANTEES:

  - Every Save/Delete is one atomic transaction (upsert by id)
  - Deleting a missing id is not an error
  - Collection reads return empty, never NotFound
  - ReadServerInfo returns a zero-value record when absent
  - Any call while the store is not open returns StoreUnavailable

  Records are passed by value snapshot; the store keeps no reference to
  caller objects after a call returns.

  Inflight and retained messages share one container and are told apart
  by RecordKind only.
*/

class Store {
 public:
  virtual ~Store() = default;

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  virtual Result Open() = 0;

  // Safe to call more than once.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  // ---------------------------------------------------------------------
  // Server info (singleton)
  // ---------------------------------------------------------------------

  virtual Result SaveServerInfo(const v1::ServerInfo&) = 0;

  virtual Result ReadServerInfo(v1::ServerInfo& out) = 0;

  // ---------------------------------------------------------------------
  // Clients
  // ---------------------------------------------------------------------

  virtual Result SaveClient(const v1::Client&) = 0;

  virtual Result DeleteClient(const std::string& id) = 0;

  virtual Result ReadClients(std::vector<v1::Client>& out) = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  virtual Result SaveSubscription(const v1::Subscription&) = 0;

  virtual Result DeleteSubscription(const std::string& id) = 0;

  virtual Result ReadSubscriptions(std::vector<v1::Subscription>& out) = 0;

  // ---------------------------------------------------------------------
  // Messages (shared container, kind = INFLIGHT | RETAINED)
  // ---------------------------------------------------------------------

  // Stores a copy stamped with `kind`.
  virtual Result SaveMessage(v1::RecordKind kind, const v1::Message&) = 0;

  virtual Result DeleteMessage(v1::RecordKind kind, const std::string& id) = 0;

  // Secondary-index lookup; order unspecified.
  virtual Result FindMessagesByKind(v1::RecordKind kind, std::vector<v1::Message>& out) = 0;

  Result SaveInflight(const v1::Message& m) {
    return SaveMessage(v1::RECORD_KIND_INFLIGHT, m);
  }
  Result SaveRetained(const v1::Message& m) {
    return SaveMessage(v1::RECORD_KIND_RETAINED, m);
  }
  Result DeleteInflight(const std::string& id) {
    return DeleteMessage(v1::RECORD_KIND_INFLIGHT, id);
  }
  Result DeleteRetained(const std::string& id) {
    return DeleteMessage(v1::RECORD_KIND_RETAINED, id);
  }
  Result ReadInflight(std::vector<v1::Message>& out) {
    return FindMessagesByKind(v1::RECORD_KIND_INFLIGHT, out);
  }
  Result ReadRetained(std::vector<v1::Message>& out) {
    return FindMessagesByKind(v1::RECORD_KIND_RETAINED, out);
  }

  // Removes one record by kind+id. The server info row cannot be deleted.
  Result Delete(v1::RecordKind kind, const std::string& id);

  // ---------------------------------------------------------------------
  // Expiry
  // ---------------------------------------------------------------------

  // Deletes every inflight message with created < expiry or created == 0.
  // Stops at the first failed deletion and returns it; a later run
  // picks up whatever was left.
  Result ClearExpiredInflight(int64_t expiry);
};

bool IsMessageKind(v1::RecordKind kind);

} // namespace brokerstore::db
