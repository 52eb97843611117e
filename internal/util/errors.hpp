#pragma once

#include <stdexcept>
#include <string>

namespace brokerstore::util {

/*
  Central error types for open-time failures.

  Thrown by the engine wrapper and the file lock; the store translates
  them into db::Result codes at its boundary.
*/

class OpenFailure : public std::runtime_error {
 public:
  explicit OpenFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockTimeout : public std::runtime_error {
 public:
  explicit LockTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace brokerstore::util
