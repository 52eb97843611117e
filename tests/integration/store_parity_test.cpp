#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "brokerstore/v1.hpp"
#include "internal/db/api/store.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/model/record_ids.hpp"

namespace {

namespace v1 = brokerstore::v1;

using brokerstore::db::Result;
using brokerstore::db::Store;
using brokerstore::db::StoreOptions;
using brokerstore::db::memory::MemoryStore;
using brokerstore::db::sqlite::SqliteStore;
using brokerstore::model::ClientKey;
using brokerstore::model::InflightKey;
using brokerstore::model::RetainedKey;
using brokerstore::model::SubscriptionKey;
using google::protobuf::util::MessageDifferencer;

void RequireOk(const Result& r) {
  assert(r);
  (void)r;
}

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::unique_ptr<Store>()>      make_store;
  bool                                         supports_restart = false;
  std::function<void(std::unique_ptr<Store>&)> restart;
  std::function<void()>                        cleanup;
};

// Everything a broker would read back at startup, sorted by id.
struct Snapshot {
  v1::ServerInfo                server_info;
  std::vector<v1::Client>       clients;
  std::vector<v1::Subscription> subscriptions;
  std::vector<v1::Message>      inflight;
  std::vector<v1::Message>      retained;
};

template <typename T>
void SortById(std::vector<T>& records) {
  std::sort(records.begin(), records.end(), [](const T& a, const T& b) { return a.id() < b.id(); });
}

template <typename T>
bool SameRecords(const std::vector<T>& a, const std::vector<T>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!MessageDifferencer::Equals(a[i], b[i])) return false;
  }
  return true;
}

Snapshot Load(Store& store) {
  Snapshot s;
  RequireOk(store.ReadServerInfo(s.server_info));
  RequireOk(store.ReadClients(s.clients));
  RequireOk(store.ReadSubscriptions(s.subscriptions));
  RequireOk(store.ReadInflight(s.inflight));
  RequireOk(store.ReadRetained(s.retained));
  SortById(s.clients);
  SortById(s.subscriptions);
  SortById(s.inflight);
  SortById(s.retained);
  return s;
}

bool SameSnapshot(const Snapshot& a, const Snapshot& b) {
  return MessageDifferencer::Equals(a.server_info, b.server_info) && SameRecords(a.clients, b.clients) &&
         SameRecords(a.subscriptions, b.subscriptions) && SameRecords(a.inflight, b.inflight) && SameRecords(a.retained, b.retained);
}

v1::Client Client(const std::string& client_id, bool clean) {
  v1::Client c;
  c.set_id(ClientKey(client_id));
  c.set_client_id(client_id);
  c.set_listener("tcp");
  c.set_clean_session(clean);
  c.set_protocol_version(4);
  return c;
}

v1::Subscription Subscription(const std::string& client_id, const std::string& filter, uint32_t qos) {
  v1::Subscription s;
  s.set_id(SubscriptionKey(client_id, filter));
  s.set_client(client_id);
  s.set_filter(filter);
  s.set_qos(qos);
  return s;
}

v1::Message Publish(const std::string& id, const std::string& client_id, const std::string& topic, const std::string& payload,
                    uint16_t packet_id, int64_t created) {
  v1::Message m;
  m.set_id(id);
  m.set_client(client_id);
  m.set_topic_name(topic);
  m.set_payload(payload);
  m.set_packet_id(packet_id);
  m.set_created(created);
  m.mutable_fixed_header()->set_type(3);
  m.mutable_fixed_header()->set_qos(1);
  return m;
}

// Drives the store through a broker session lifecycle and returns what a
// restart would load.
Snapshot RunSessionLifecycle(Store& store) {
  // fresh store: never fails, everything empty
  auto empty = Load(store);
  assert(empty.clients.empty() && empty.subscriptions.empty() && empty.inflight.empty() && empty.retained.empty());
  assert(empty.server_info.id().empty());

  v1::ServerInfo info;
  info.mutable_info()->set_version("1.0.0");
  info.mutable_info()->set_started(1700000000);
  RequireOk(store.SaveServerInfo(info));

  // connect + subscribe
  RequireOk(store.SaveClient(Client("alice", false)));
  RequireOk(store.SaveClient(Client("bob", true)));
  RequireOk(store.SaveSubscription(Subscription("alice", "sensors/#", 1)));
  RequireOk(store.SaveSubscription(Subscription("bob", "alerts/+", 2)));

  // qos1 deliveries awaiting ack
  RequireOk(store.SaveInflight(Publish(InflightKey("alice", 1), "alice", "sensors/t1", "21.5", 1, 1700000100)));
  RequireOk(store.SaveInflight(Publish(InflightKey("alice", 2), "alice", "sensors/t2", "19.0", 2, 1700000200)));
  RequireOk(store.SaveInflight(Publish(InflightKey("bob", 1), "bob", "alerts/fire", "!", 1, 0)));

  // retained publishes, second one later cleared by an empty retain
  RequireOk(store.SaveRetained(Publish(RetainedKey("sensors/t1"), "alice", "sensors/t1", "21.5", 0, 1700000100)));
  RequireOk(store.SaveRetained(Publish(RetainedKey("alerts/fire"), "bob", "alerts/fire", "!", 0, 1700000150)));
  RequireOk(store.DeleteRetained(RetainedKey("alerts/fire")));

  // ack for alice/1
  RequireOk(store.DeleteInflight(InflightKey("alice", 1)));

  // bob disconnects with a clean session
  RequireOk(store.Delete(v1::RECORD_KIND_CLIENT, ClientKey("bob")));
  RequireOk(store.Delete(v1::RECORD_KIND_SUBSCRIPTION, SubscriptionKey("bob", "alerts/+")));

  // periodic snapshot overwrites server info
  info.mutable_info()->set_uptime(300);
  info.mutable_info()->set_clients_connected(1);
  RequireOk(store.SaveServerInfo(info));

  // sweep drops bob's unknown-age inflight, keeps alice/2
  RequireOk(store.ClearExpiredInflight(1700000150));

  auto s = Load(store);
  assert(s.server_info.info().uptime() == 300);
  assert(s.clients.size() == 1 && s.clients[0].client_id() == "alice");
  assert(s.subscriptions.size() == 1 && s.subscriptions[0].filter() == "sensors/#");
  assert(s.inflight.size() == 1 && s.inflight[0].id() == InflightKey("alice", 2));
  assert(s.retained.size() == 1 && s.retained[0].topic_name() == "sensors/t1");
  return s;
}

void VerifyRestartDurability(BackendFactory& backend, std::unique_ptr<Store>& store, const Snapshot& before) {
  if (!backend.supports_restart) {
    return;
  }

  backend.restart(store);
  assert(SameSnapshot(Load(*store), before));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_unique<MemoryStore>(); },
      .supports_restart = false,
      .restart          = [](std::unique_ptr<Store>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("brokerstore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() -> std::unique_ptr<Store> {
    StoreOptions options;
    options.path = db_path;
    return std::make_unique<SqliteStore>(options);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = true,
      .restart =
          [make_store](std::unique_ptr<Store>& store) {
            store->Close();
            store = make_store();
            RequireOk(store->Open());
          },
      .cleanup =
          [db_path]() {
            for (const char* suffix : {"", "-wal", "-shm", ".lock"}) {
              std::filesystem::remove(db_path + suffix);
            }
          },
  };
}

Snapshot RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();
  RequireOk(store->Open());

  auto snapshot = RunSessionLifecycle(*store);
  VerifyRestartDurability(backend, store, snapshot);

  store->Close();
  backend.cleanup();
  return snapshot;
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  std::vector<Snapshot> results;
  for (auto& backend : backends) {
    results.push_back(RunBackendSuite(backend));
  }

  for (size_t i = 1; i < results.size(); ++i) {
    assert(SameSnapshot(results[0], results[i]));
  }

  std::cout << "brokerstore_integration_store_parity: pass\n";
  return 0;
}
