#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "brokerstore/v1.hpp"
#include "internal/db/api/store.hpp"
#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/sweep/expiry_sweeper.hpp"

namespace {

namespace v1 = brokerstore::v1;

using brokerstore::db::ErrorCode;
using brokerstore::db::Result;
using brokerstore::db::Store;
using brokerstore::db::StoreOptions;
using brokerstore::db::memory::MemoryStore;
using brokerstore::db::sqlite::SqliteStore;
using brokerstore::sweep::ExpirySweeper;

void RequireOk(const Result& r) {
  assert(r);
  (void)r;
}

void RequireCode(const Result& r, ErrorCode code) {
  assert(r.code == code);
  (void)r;
  (void)code;
}

// Delegates to a MemoryStore and fails chosen inflight deletions.
class FailingStore : public Store {
 public:
  Result Open() override { return inner_.Open(); }
  void   Close() override { inner_.Close(); }
  bool   IsOpen() const override { return inner_.IsOpen(); }

  Result SaveServerInfo(const v1::ServerInfo& r) override { return inner_.SaveServerInfo(r); }
  Result ReadServerInfo(v1::ServerInfo& out) override { return inner_.ReadServerInfo(out); }

  Result SaveClient(const v1::Client& r) override { return inner_.SaveClient(r); }
  Result DeleteClient(const std::string& id) override { return inner_.DeleteClient(id); }
  Result ReadClients(std::vector<v1::Client>& out) override { return inner_.ReadClients(out); }

  Result SaveSubscription(const v1::Subscription& r) override { return inner_.SaveSubscription(r); }
  Result DeleteSubscription(const std::string& id) override { return inner_.DeleteSubscription(id); }
  Result ReadSubscriptions(std::vector<v1::Subscription>& out) override { return inner_.ReadSubscriptions(out); }

  Result SaveMessage(v1::RecordKind kind, const v1::Message& m) override { return inner_.SaveMessage(kind, m); }

  Result DeleteMessage(v1::RecordKind kind, const std::string& id) override {
    ++delete_attempts;
    if (fail_deletes) {
      return Result::Err(ErrorCode::IOError, "disk full");
    }
    return inner_.DeleteMessage(kind, id);
  }

  Result FindMessagesByKind(v1::RecordKind kind, std::vector<v1::Message>& out) override {
    return inner_.FindMessagesByKind(kind, out);
  }

  bool fail_deletes    = false;
  int  delete_attempts = 0;

 private:
  MemoryStore inner_;
};

v1::Message Inflight(const std::string& id, int64_t created) {
  v1::Message m;
  m.set_id(id);
  m.set_created(created);
  m.set_topic_name("t");
  return m;
}

std::vector<int64_t> CreatedOf(Store& store) {
  std::vector<v1::Message> inflight;
  RequireOk(store.ReadInflight(inflight));

  std::vector<int64_t> created;
  for (const auto& m : inflight) created.push_back(m.created());
  std::sort(created.begin(), created.end());
  return created;
}

std::unique_ptr<SqliteStore> OpenSqlite(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "brokerstore_expiry_sweeper_tests";
  std::filesystem::create_directories(dir);

  const auto path = (dir / (name + ".db")).string();
  for (const char* suffix : {"", "-wal", "-shm", ".lock"}) {
    std::filesystem::remove(path + suffix);
  }

  StoreOptions options;
  options.path = path;
  auto store   = std::make_unique<SqliteStore>(options);
  RequireOk(store->Open());
  return store;
}

void VerifyClearExpiredInflight(Store& store) {
  for (int64_t created : {0, 100, 200, 300}) {
    RequireOk(store.SaveInflight(Inflight("if_c_" + std::to_string(created), created)));
  }

  // retained messages are never swept, even with unknown age
  v1::Message retained = Inflight("ret_t", 0);
  RequireOk(store.SaveRetained(retained));

  RequireOk(store.ClearExpiredInflight(200));

  assert((CreatedOf(store) == std::vector<int64_t>{200, 300}));

  std::vector<v1::Message> retained_after;
  RequireOk(store.ReadRetained(retained_after));
  assert(retained_after.size() == 1);

  // second pass is a no-op
  RequireOk(store.ClearExpiredInflight(200));
  assert((CreatedOf(store) == std::vector<int64_t>{200, 300}));
}

void TestClearExpiredInflightMemory() {
  MemoryStore store;
  RequireOk(store.Open());
  VerifyClearExpiredInflight(store);
}

void TestClearExpiredInflightSqlite() {
  auto store = OpenSqlite("clear_expired");
  VerifyClearExpiredInflight(*store);
}

void TestSweeperAppliesTtlToClock() {
  MemoryStore store;
  RequireOk(store.Open());

  const auto now = std::chrono::system_clock::time_point(std::chrono::seconds(1000));
  ExpirySweeper sweeper(store, std::chrono::seconds(300), [now] { return now; });
  assert(sweeper.Threshold() == 700);

  RequireOk(store.SaveInflight(Inflight("old", 650)));
  RequireOk(store.SaveInflight(Inflight("edge", 700)));
  RequireOk(store.SaveInflight(Inflight("new", 750)));

  RequireOk(sweeper.RunOnce());
  assert((CreatedOf(store) == std::vector<int64_t>{700, 750}));
}

void TestZeroTtlDisablesSweep() {
  MemoryStore store;
  RequireOk(store.Open());
  RequireOk(store.SaveInflight(Inflight("unknown_age", 0)));

  ExpirySweeper sweeper(store, std::chrono::seconds(0));
  RequireOk(sweeper.RunOnce());
  assert(CreatedOf(store).size() == 1);
}

void TestFailedDeletionAbortsSweep() {
  FailingStore store;
  RequireOk(store.Open());
  RequireOk(store.SaveInflight(Inflight("a", 0)));
  RequireOk(store.SaveInflight(Inflight("b", 10)));
  RequireOk(store.SaveInflight(Inflight("c", 20)));
  RequireOk(store.SaveInflight(Inflight("d", 500)));

  store.fail_deletes = true;
  auto r             = store.ClearExpiredInflight(100);
  assert(r.code == ErrorCode::IOError);
  assert(store.delete_attempts == 1);
  assert(CreatedOf(store).size() == 4);

  // the next run picks up what was left
  store.fail_deletes = false;
  RequireOk(store.ClearExpiredInflight(100));
  assert((CreatedOf(store) == std::vector<int64_t>{500}));
}

void TestSweepOnClosedStoreIsUnavailable() {
  MemoryStore   store;
  ExpirySweeper sweeper(store, std::chrono::seconds(60));
  RequireCode(sweeper.RunOnce(), ErrorCode::StoreUnavailable);
}

void TestPeriodicLoopSweepsAndStops() {
  MemoryStore store;
  RequireOk(store.Open());
  RequireOk(store.SaveInflight(Inflight("unknown_age", 0)));

  ExpirySweeper sweeper(store, std::chrono::seconds(60));
  sweeper.Start(std::chrono::milliseconds(10));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!CreatedOf(store).empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(CreatedOf(store).empty());

  sweeper.Stop();
  sweeper.Stop();

  // nothing runs after Stop
  RequireOk(store.SaveInflight(Inflight("late", 0)));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(CreatedOf(store).size() == 1);
}

void TestLastExpiryIsTheThresholdUsed() {
  MemoryStore store;
  RequireOk(store.Open());
  RequireOk(store.SaveInflight(Inflight("old", 650)));
  RequireOk(store.SaveInflight(Inflight("new", 750)));

  // every clock read moves time forward by 1000s
  int64_t       reads = 0;
  ExpirySweeper sweeper(store, std::chrono::seconds(300), [&reads] {
    ++reads;
    return std::chrono::system_clock::time_point(std::chrono::seconds(1000 * reads));
  });
  assert(sweeper.LastExpiry() == 0);

  RequireOk(sweeper.RunOnce());
  assert(sweeper.LastExpiry() == 700);
  assert(sweeper.Threshold() == 1700);
  assert(sweeper.LastExpiry() == 700);
  assert((CreatedOf(store) == std::vector<int64_t>{750}));
}

void TestStopFromSeveralThreadsThenRestart() {
  MemoryStore store;
  RequireOk(store.Open());

  ExpirySweeper sweeper(store, std::chrono::seconds(60));
  sweeper.Start(std::chrono::milliseconds(5));

  std::vector<std::thread> stoppers;
  for (int i = 0; i < 4; ++i) {
    stoppers.emplace_back([&sweeper] { sweeper.Stop(); });
  }
  for (auto& t : stoppers) t.join();

  // stopped: nothing is swept
  RequireOk(store.SaveInflight(Inflight("unknown_age", 0)));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(CreatedOf(store).size() == 1);

  // a stopped sweeper can be started again
  sweeper.Start(std::chrono::milliseconds(5));
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!CreatedOf(store).empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(CreatedOf(store).empty());
  sweeper.Stop();
}

} // namespace

int main() {
  TestClearExpiredInflightMemory();
  TestClearExpiredInflightSqlite();
  TestSweeperAppliesTtlToClock();
  TestZeroTtlDisablesSweep();
  TestFailedDeletionAbortsSweep();
  TestSweepOnClosedStoreIsUnavailable();
  TestPeriodicLoopSweepsAndStops();
  TestLastExpiryIsTheThresholdUsed();
  TestStopFromSeveralThreadsThenRestart();

  std::cout << "brokerstore_unit_expiry_sweeper: pass\n";
  return 0;
}
