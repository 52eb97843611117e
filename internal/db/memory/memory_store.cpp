#include "memory_store.hpp"

#include "internal/model/record_ids.hpp"

namespace brokerstore::db::memory {

namespace {

Result Unavailable() {
  return Result::Err(ErrorCode::StoreUnavailable, "store not open");
}

template <typename T>
void CopyValues(const std::unordered_map<std::string, T>& from, std::vector<T>& out) {
  out.reserve(from.size());
  for (const auto& [_, record] : from) {
    out.push_back(record);
  }
}

} // namespace

MemoryStore::MemoryStore() = default;

Result MemoryStore::Open() {
  std::lock_guard<std::mutex> lock(mutex_);
  open_ = true;
  return Result::Ok();
}

void MemoryStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  open_ = false;
}

bool MemoryStore::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

std::unordered_map<std::string, v1::Message>& MemoryStore::Messages(v1::RecordKind kind) {
  return kind == v1::RECORD_KIND_INFLIGHT ? state_.inflight : state_.retained;
}

Result MemoryStore::SaveServerInfo(const v1::ServerInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();

  v1::ServerInfo record = info;
  record.set_id(model::kServerInfoId);
  record.set_kind(v1::RECORD_KIND_SERVER_INFO);
  state_.server_info = std::move(record);
  return Result::Ok();
}

Result MemoryStore::ReadServerInfo(v1::ServerInfo& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out.Clear();
  if (!open_) return Unavailable();

  if (state_.server_info) out = *state_.server_info;
  return Result::Ok();
}

Result MemoryStore::SaveClient(const v1::Client& client) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();
  if (client.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "client id is empty");

  auto& record = state_.clients[client.id()];
  record       = client;
  record.set_kind(v1::RECORD_KIND_CLIENT);
  return Result::Ok();
}

Result MemoryStore::DeleteClient(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();

  state_.clients.erase(id);
  return Result::Ok();
}

Result MemoryStore::ReadClients(std::vector<v1::Client>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  if (!open_) return Unavailable();

  CopyValues(state_.clients, out);
  return Result::Ok();
}

Result MemoryStore::SaveSubscription(const v1::Subscription& sub) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();
  if (sub.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "subscription id is empty");

  auto& record = state_.subscriptions[sub.id()];
  record       = sub;
  record.set_kind(v1::RECORD_KIND_SUBSCRIPTION);
  return Result::Ok();
}

Result MemoryStore::DeleteSubscription(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();

  state_.subscriptions.erase(id);
  return Result::Ok();
}

Result MemoryStore::ReadSubscriptions(std::vector<v1::Subscription>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  if (!open_) return Unavailable();

  CopyValues(state_.subscriptions, out);
  return Result::Ok();
}

Result MemoryStore::SaveMessage(v1::RecordKind kind, const v1::Message& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");
  if (message.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "message id is empty");

  auto& record = Messages(kind)[message.id()];
  record       = message;
  record.set_kind(kind);
  return Result::Ok();
}

Result MemoryStore::DeleteMessage(v1::RecordKind kind, const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");

  Messages(kind).erase(id);
  return Result::Ok();
}

Result MemoryStore::FindMessagesByKind(v1::RecordKind kind, std::vector<v1::Message>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  if (!open_) return Unavailable();
  if (!IsMessageKind(kind)) return Result::Err(ErrorCode::InvalidArgument, "not a message kind");

  CopyValues(Messages(kind), out);
  return Result::Ok();
}

} // namespace brokerstore::db::memory
