#pragma once

#include <string>

namespace brokerstore::db {

/*
  Portable store result codes.

  The backend layer must translate engine errors into these.
  Callers should never depend on sqlite error types.

  Taxonomy at the store boundary:
    StoreUnavailable   operation on a store that is not open
    LockTimeout        exclusive file lock not acquired in time
    OpenFailure        backing file unreadable, not a database, schema failed
    InvalidArgument    record without an identifier
    Busy / IOError /
    Corruption /
    InternalError      persist failures surfaced from the engine
*/

enum class ErrorCode {
  OK = 0,

  StoreUnavailable,
  LockTimeout,
  OpenFailure,

  InvalidArgument,

  Busy,
  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // true for engine failures distinct from precondition/open errors
  bool IsPersistFailure() const {
    return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::Corruption || code == ErrorCode::InternalError;
  }
};

const char* ErrorCodeName(ErrorCode code);

} // namespace brokerstore::db
