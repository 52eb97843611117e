#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace brokerstore::util {

/*
  Time utilities; single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t  ToUnixSeconds(TimePoint tp);
uint64_t ToUnixMillis(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace brokerstore::util
