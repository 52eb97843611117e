#pragma once

#include <chrono>
#include <string>

namespace brokerstore::db::lock {

/*
  Exclusive advisory lock (flock) held for the lifetime of the object.

  Acquisition retries a non-blocking lock until the timeout elapses, so a
  second holder fails fast instead of hanging. The lock lives on its own
  file: closing a descriptor of the database file would drop the engine's
  POSIX locks on it.

  Throws util::LockTimeout when the lock is held elsewhere past the
  timeout, util::OpenFailure when the lock file cannot be opened.
*/
class FileLock {
 public:
  FileLock(std::string path, std::chrono::milliseconds timeout);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

  const std::string& Path() const {
    return path_;
  }

 private:
  std::string path_;
  int         fd_ = -1;
};

} // namespace brokerstore::db::lock
