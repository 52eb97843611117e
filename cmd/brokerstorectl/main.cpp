#include <google/protobuf/text_format.h>

#include <iostream>
#include <string>
#include <vector>

#include "brokerstore/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/api/store.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sweep/expiry_sweeper.hpp"

using namespace brokerstore;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitStore = 2;

void Usage() {
  std::cout << "Usage:\n"
            << "  brokerstorectl <config.yaml> stats\n"
            << "  brokerstorectl <config.yaml> sweep\n"
            << "  brokerstorectl <config.yaml> dump <server|clients|subscriptions|inflight|retained>\n";
}

int Fail(const std::string& what, const db::Result& r) {
  BROKERSTORE_LOG_ERROR(what, {observability::StringField("code", db::ErrorCodeName(r.code)),
                               observability::StringField("error", r.message)});
  return kExitStore;
}

template <typename T>
void Print(const T& record) {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(record, &text)) {
    text = "<unprintable>";
  }
  std::cout << "---\n" << text;
}

template <typename T>
void PrintAll(const std::vector<T>& records) {
  for (const auto& r : records) Print(r);
}

int Stats(db::Store& store) {
  v1::ServerInfo                info;
  std::vector<v1::Client>       clients;
  std::vector<v1::Subscription> subs;
  std::vector<v1::Message>      inflight;
  std::vector<v1::Message>      retained;

  if (auto r = store.ReadServerInfo(info); !r) return Fail("read server info failed", r);
  if (auto r = store.ReadClients(clients); !r) return Fail("read clients failed", r);
  if (auto r = store.ReadSubscriptions(subs); !r) return Fail("read subscriptions failed", r);
  if (auto r = store.ReadInflight(inflight); !r) return Fail("read inflight failed", r);
  if (auto r = store.ReadRetained(retained); !r) return Fail("read retained failed", r);

  std::cout << "server_version: " << (info.info().version().empty() ? "-" : info.info().version()) << "\n"
            << "clients: " << clients.size() << "\n"
            << "subscriptions: " << subs.size() << "\n"
            << "inflight: " << inflight.size() << "\n"
            << "retained: " << retained.size() << "\n";
  return 0;
}

int Dump(db::Store& store, const std::string& kind) {
  db::Result r;
  if (kind == "server") {
    v1::ServerInfo info;
    r = store.ReadServerInfo(info);
    if (r) Print(info);
  } else if (kind == "clients") {
    std::vector<v1::Client> out;
    r = store.ReadClients(out);
    if (r) PrintAll(out);
  } else if (kind == "subscriptions") {
    std::vector<v1::Subscription> out;
    r = store.ReadSubscriptions(out);
    if (r) PrintAll(out);
  } else if (kind == "inflight" || kind == "retained") {
    std::vector<v1::Message> out;
    r = kind == "inflight" ? store.ReadInflight(out) : store.ReadRetained(out);
    if (r) PrintAll(out);
  } else {
    Usage();
    return kExitUsage;
  }

  return r ? 0 : Fail("dump failed", r);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto store = factory::BuildStore(config);
    if (auto r = store->Open(); !r) {
      int code = Fail("cannot open store", r);
      observability::ShutdownLogging();
      return code;
    }

    int code = 0;
    if (command == "stats") {
      code = Stats(*store);
    } else if (command == "sweep") {
      const auto           ttl = factory::InflightTtl(config);
      sweep::ExpirySweeper sweeper(*store, ttl);
      auto                 r = sweeper.RunOnce();
      if (r && ttl.count() <= 0) {
        std::cout << "sweep disabled (inflight_ttl is 0)\n";
      } else if (r) {
        std::cout << "swept inflight created before " << sweeper.LastExpiry() << "\n";
      }
      code = r ? 0 : Fail("sweep failed", r);
    } else if (command == "dump" && argc == 4) {
      code = Dump(*store, argv[3]);
    } else {
      Usage();
      code = kExitUsage;
    }

    store->Close();
    observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    BROKERSTORE_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return kExitStore;
  }
}
