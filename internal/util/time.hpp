#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace asyncprof::util {

/*
  Time utilities: the single place that picks the clock source.

  Everything the profiler measures is monotonic; wall-clock time never
  enters a session.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::nanoseconds;

TimePoint Now();

Duration FromProto(const google::protobuf::Duration& d);

double ToMillis(Duration d);

} // namespace asyncprof::util
