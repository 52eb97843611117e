#include "record_ids.hpp"

namespace brokerstore::model {

std::string ClientKey(std::string_view client_id) {
  std::string key = "cl_";
  key.append(client_id);
  return key;
}

std::string SubscriptionKey(std::string_view client_id, std::string_view filter) {
  std::string key = "sub_";
  key.append(client_id);
  key.push_back(':');
  key.append(filter);
  return key;
}

std::string InflightKey(std::string_view client_id, uint16_t packet_id) {
  std::string key = "if_";
  key.append(client_id);
  key.push_back('_');
  key.append(std::to_string(packet_id));
  return key;
}

std::string RetainedKey(std::string_view topic) {
  std::string key = "ret_";
  key.append(topic);
  return key;
}

} // namespace brokerstore::model
