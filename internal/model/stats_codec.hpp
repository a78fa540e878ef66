#pragma once

#include <string>
#include <utility>
#include <vector>

#include "asyncprof/stats/v1/stats.pb.h"
#include "internal/model/profile_stats.hpp"

namespace asyncprof::model {

/*
  Export of finalized stats for a presentation layer. Times become
  milliseconds (double) relative to session start. The task forest is
  flattened depth-first; nodes link by parent_id and children ids.
*/

asyncprof::stats::v1::ProfileStats ToProto(const ProfileStats& stats, const std::string& summary = {});

// Throws std::runtime_error if protobuf refuses to serialize.
std::string ToJson(const ProfileStats& stats, const std::string& summary = {});

// {"profiling", overhead ms}, {"profiled_time", session ms}: Server-Timing metrics.
std::vector<std::pair<std::string, double>> ServerTiming(const ProfileStats& stats);

// "profiling;dur=0.412, profiled_time;dur=35.120"
std::string FormatServerTiming(const ProfileStats& stats);

} // namespace asyncprof::model
