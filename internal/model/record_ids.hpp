#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace brokerstore::model {

/*
  Canonical primary keys.

  Prefixes keep ids from different kinds apart when a record is
  inspected outside the store (dumps, logs).
*/

inline constexpr const char* kServerInfoId = "srv";

std::string ClientKey(std::string_view client_id);
std::string SubscriptionKey(std::string_view client_id, std::string_view filter);
std::string InflightKey(std::string_view client_id, uint16_t packet_id);
std::string RetainedKey(std::string_view topic);

} // namespace brokerstore::model
