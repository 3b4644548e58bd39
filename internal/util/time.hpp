#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace netorch::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted timestamps are Unix epoch milliseconds (UTC).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

google::protobuf::Timestamp MillisToProto(int64_t ms);
int64_t                     ProtoToMillis(const google::protobuf::Timestamp& ts);

} // namespace netorch::util
