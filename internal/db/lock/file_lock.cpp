#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

namespace brokerstore::db::lock {

namespace {

constexpr std::chrono::milliseconds kRetryInterval{50};

std::string ErrnoMessage(const std::string& what, const std::string& path, int err) {
  return what + " " + path + ": " + std::strerror(err);
}

} // namespace

FileLock::FileLock(std::string path, std::chrono::milliseconds timeout) : path_(std::move(path)) {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd_ < 0) {
    throw util::OpenFailure(ErrnoMessage("cannot open lock file", path_, errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
      return;
    }

    const int err = errno;
    if (err == EINTR) continue;

    if (err != EWOULDBLOCK) {
      ::close(fd_);
      fd_ = -1;
      throw util::OpenFailure(ErrnoMessage("cannot lock", path_, err));
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::close(fd_);
      fd_ = -1;
      throw util::LockTimeout("timed out waiting for lock on " + path_);
    }

    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kRetryInterval, deadline - now));
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace brokerstore::db::lock
