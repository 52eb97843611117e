#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/store.hpp"
#include "internal/db/api/store_options.hpp"

namespace brokerstore::factory {

inline constexpr std::chrono::seconds kDefaultInflightTtl{24 * 60 * 60};
inline constexpr std::chrono::seconds kDefaultSweepInterval{60};

db::StoreOptions StoreOptionsFromConfig(const brokerstore::runtime::config::RuntimeConfig& config);

std::chrono::seconds      InflightTtl(const brokerstore::runtime::config::RuntimeConfig& config);
std::chrono::milliseconds SweepInterval(const brokerstore::runtime::config::RuntimeConfig& config);

/*
  BuildStore

  Composition root for persistence: the ONLY place allowed to know
  concrete store types. The returned store is not yet open; the owner
  calls Open() at startup and Close() at shutdown.

  Throws std::invalid_argument for an unknown backend or synchronous mode.
*/
std::unique_ptr<db::Store> BuildStore(const brokerstore::runtime::config::RuntimeConfig& config);

} // namespace brokerstore::factory
