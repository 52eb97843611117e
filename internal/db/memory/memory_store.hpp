#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/db/api/store.hpp"

namespace brokerstore::db::memory {

/*
  Volatile store with the same contract as the durable backend.

  Used when persistence is disabled and as the reference in backend
  parity tests. Nothing survives the process. Open/Close keep their
  contents so a reopen behaves like the durable backend.
*/
class MemoryStore final : public db::Store {
public:
  MemoryStore();

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

private:
  struct State {
    std::optional<v1::ServerInfo> server_info;
    std::unordered_map<std::string, v1::Client> clients;
    std::unordered_map<std::string, v1::Subscription> subscriptions;
    std::unordered_map<std::string, v1::Message> inflight;
    std::unordered_map<std::string, v1::Message> retained;
  };

  std::unordered_map<std::string, v1::Message>& Messages(v1::RecordKind kind);

  mutable std::mutex mutex_;
  bool open_ = false;
  State state_;
};

}
