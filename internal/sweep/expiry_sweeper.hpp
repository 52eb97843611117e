#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "internal/db/api/store.hpp"
#include "internal/util/time.hpp"

namespace brokerstore::sweep {

/*
  Owner-side scheduling of inflight expiry.

  The store never runs this on its own; the broker either calls RunOnce()
  from its own timer or hands the loop to Start()/Stop(). Each run
  deletes inflight messages created more than `ttl` seconds ago, plus
  those with an unknown creation time.
*/
class ExpirySweeper {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  ExpirySweeper(db::Store& store, std::chrono::seconds ttl, ClockFn clock = util::Now);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper&)            = delete;
  ExpirySweeper& operator=(const ExpirySweeper&) = delete;

  // ttl <= 0 disables the sweep
  db::Result RunOnce();

  // Unix-seconds threshold the next run would use.
  int64_t Threshold() const;

  // Threshold used by the most recent run, 0 before the first.
  int64_t LastExpiry() const {
    return last_expiry_.load();
  }

  void Start(std::chrono::milliseconds interval);
  void Stop();

 private:
  void Run(std::chrono::milliseconds interval);

  db::Store&           store_;
  std::chrono::seconds ttl_;
  ClockFn              clock_;

  std::atomic<int64_t> last_expiry_{0};

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
};

} // namespace brokerstore::sweep
