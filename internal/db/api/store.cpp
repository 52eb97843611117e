#include "internal/db/api/store.hpp"

#include "internal/db/api/store_options.hpp"

namespace brokerstore::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::StoreUnavailable:
      return "store_unavailable";
    case ErrorCode::LockTimeout:
      return "lock_timeout";
    case ErrorCode::OpenFailure:
      return "open_failure";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

std::string ResolveStorePath(const std::string& path) {
  if (path.empty() || path == ".") {
    return kDefaultStorePath;
  }
  return path;
}

bool IsMessageKind(v1::RecordKind kind) {
  return kind == v1::RECORD_KIND_INFLIGHT || kind == v1::RECORD_KIND_RETAINED;
}

Result Store::Delete(v1::RecordKind kind, const std::string& id) {
  switch (kind) {
    case v1::RECORD_KIND_CLIENT:
      return DeleteClient(id);
    case v1::RECORD_KIND_SUBSCRIPTION:
      return DeleteSubscription(id);
    case v1::RECORD_KIND_INFLIGHT:
    case v1::RECORD_KIND_RETAINED:
      return DeleteMessage(kind, id);
    default:
      return Result::Err(ErrorCode::InvalidArgument, "record kind cannot be deleted");
  }
}

Result Store::ClearExpiredInflight(int64_t expiry) {
  std::vector<v1::Message> inflight;
  auto                     read = ReadInflight(inflight);
  if (!read) return read;

  for (const auto& m : inflight) {
    if (m.created() < expiry || m.created() == 0) {
      auto del = DeleteInflight(m.id());
      if (!del) return del;
    }
  }

  return Result::Ok();
}

} // namespace brokerstore::db
