#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/profile_stats.hpp"

namespace asyncprof::model {

// min/avg/max over the lags; p95 by nearest rank. Empty input gives zeros.
LagSummary SummarizeLag(const std::vector<session::LagSample>& samples, util::Duration lag_threshold);

// Highest cumulative time first, at most `limit` entries.
std::vector<session::FunctionTiming> TopFunctions(std::vector<session::FunctionTiming> timings, std::size_t limit);

bool HasWarnings(const ProfileStats& stats, util::Duration lag_threshold);

/*
  Short label for a navigation bar:

    "2 blocking, lag 12ms"   blocking calls and a max lag above the threshold
    "2 blocking"
    "lag 12ms"
    "OK"
    "disabled"               no backend ran
*/
std::string Summarize(const ProfileStats& stats, util::Duration lag_threshold);

} // namespace asyncprof::model
