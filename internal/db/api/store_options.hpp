#pragma once

#include <chrono>
#include <string>

namespace brokerstore::db {

inline constexpr const char* kDefaultStorePath = "brokerstore.db";
inline constexpr std::chrono::milliseconds kDefaultLockTimeout{250};

enum class Synchronous {
  kNormal,
  kFull,
};

struct StoreOptions {
  // backing file; empty or "." selects kDefaultStorePath
  std::string path;

  // bounded wait for the exclusive file lock
  std::chrono::milliseconds lock_timeout = kDefaultLockTimeout;

  Synchronous synchronous = Synchronous::kNormal;
};

std::string ResolveStorePath(const std::string& path);

} // namespace brokerstore::db
