#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_store.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/util/time.hpp"

namespace brokerstore::factory {

using brokerstore::runtime::config::RuntimeConfig;

db::StoreOptions StoreOptionsFromConfig(const RuntimeConfig& config) {
  const auto& store = config.store();

  db::StoreOptions options;
  options.path = db::ResolveStorePath(store.path());

  if (store.has_lock_timeout()) {
    const auto timeout = util::FromProto(store.lock_timeout());
    if (timeout.count() > 0) options.lock_timeout = timeout;
  }

  const auto& sync = store.synchronous();
  if (sync.empty() || sync == "NORMAL" || sync == "normal") {
    options.synchronous = db::Synchronous::kNormal;
  } else if (sync == "FULL" || sync == "full") {
    options.synchronous = db::Synchronous::kFull;
  } else {
    throw std::invalid_argument("unknown store.synchronous: " + sync);
  }

  return options;
}

std::chrono::seconds InflightTtl(const RuntimeConfig& config) {
  if (!config.sweeper().has_inflight_ttl()) return kDefaultInflightTtl;
  return std::chrono::duration_cast<std::chrono::seconds>(util::FromProto(config.sweeper().inflight_ttl()));
}

std::chrono::milliseconds SweepInterval(const RuntimeConfig& config) {
  if (config.sweeper().has_interval()) {
    const auto interval = util::FromProto(config.sweeper().interval());
    if (interval.count() > 0) return interval;
  }
  return kDefaultSweepInterval;
}

std::unique_ptr<db::Store> BuildStore(const RuntimeConfig& config) {
  const auto& backend = config.store().backend();

  if (backend.empty() || backend == "sqlite") {
    return std::make_unique<db::sqlite::SqliteStore>(StoreOptionsFromConfig(config));
  }
  if (backend == "memory") {
    return std::make_unique<db::memory::MemoryStore>();
  }

  throw std::invalid_argument("unknown store.backend: " + backend);
}

} // namespace brokerstore::factory
