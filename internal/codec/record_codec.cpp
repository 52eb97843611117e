#include "record_codec.hpp"

#include <limits>

namespace brokerstore::codec {

bool Encode(const google::protobuf::MessageLite& record, std::string* out) {
  out->clear();
  return record.SerializeToString(out);
}

bool Decode(const void* data, std::size_t size, google::protobuf::MessageLite* record) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return false;
  }
  // empty input is the encoding of a default record
  if (size == 0) {
    record->Clear();
    return true;
  }
  return record->ParseFromArray(data, static_cast<int>(size));
}

} // namespace brokerstore::codec
