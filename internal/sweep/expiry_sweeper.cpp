#include "expiry_sweeper.hpp"

#include "internal/observability/logging.hpp"

namespace brokerstore::sweep {

using observability::IntField;
using observability::StringField;

ExpirySweeper::ExpirySweeper(db::Store& store, std::chrono::seconds ttl, ClockFn clock)
    : store_(store), ttl_(ttl), clock_(std::move(clock)) {}

ExpirySweeper::~ExpirySweeper() {
  Stop();
}

int64_t ExpirySweeper::Threshold() const {
  return util::ToUnixSeconds(clock_()) - ttl_.count();
}

db::Result ExpirySweeper::RunOnce() {
  if (ttl_.count() <= 0) {
    return db::Result::Ok();
  }

  const auto expiry = Threshold();
  last_expiry_.store(expiry);
  auto result = store_.ClearExpiredInflight(expiry);

  if (!result) {
    BROKERSTORE_LOG_WARN("inflight sweep failed", {IntField("expiry", expiry),
                                                   StringField("code", db::ErrorCodeName(result.code)),
                                                   StringField("error", result.message)});
    return result;
  }

  BROKERSTORE_LOG_DEBUG("inflight sweep done", {IntField("expiry", expiry)});
  return result;
}

void ExpirySweeper::Start(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  thread_   = std::thread(&ExpirySweeper::Run, this, interval);
}

void ExpirySweeper::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    worker    = std::move(thread_);
  }
  cv_.notify_all();

  if (worker.joinable()) {
    worker.join();
  }
}

void ExpirySweeper::Run(std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval, [this] { return stopping_; })) break;

    lock.unlock();
    // failures are logged in RunOnce and retried next tick
    auto result = RunOnce();
    if (!result && result.code == db::ErrorCode::StoreUnavailable) {
      BROKERSTORE_LOG_INFO("sweeper idle until store is open");
    }
    lock.lock();
  }
}

} // namespace brokerstore::sweep
