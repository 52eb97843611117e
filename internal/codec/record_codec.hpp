#pragma once

#include <cstddef>
#include <string>

#include <google/protobuf/message_lite.h>

namespace brokerstore::codec {

/*
  Record <-> bytes.

  Stored form is the protobuf wire encoding of the record message.
  Backends keep the bytes opaque; only the id, kind and created
  columns are lifted out for indexing.
*/

// false if the record cannot be serialized
bool Encode(const google::protobuf::MessageLite& record, std::string* out);

// false if the bytes are not a valid encoding of the record type
bool Decode(const void* data, std::size_t size, google::protobuf::MessageLite* record);

} // namespace brokerstore::codec
