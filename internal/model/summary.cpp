#include "summary.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace asyncprof::model {

LagSummary SummarizeLag(const std::vector<session::LagSample>& samples, util::Duration lag_threshold) {
  LagSummary summary;
  if (samples.empty()) return summary;

  std::vector<util::Duration> lags;
  lags.reserve(samples.size());
  util::Duration total{};
  for (const auto& sample : samples) {
    lags.push_back(sample.lag);
    total += sample.lag;
    if (sample.lag > lag_threshold) ++summary.samples_over_threshold;
  }
  std::sort(lags.begin(), lags.end());

  summary.sample_count = lags.size();
  summary.min          = lags.front();
  summary.max          = lags.back();
  summary.avg          = total / static_cast<std::int64_t>(lags.size());

  // Nearest rank: ceil(0.95 * n), 1-based.
  const auto rank = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(lags.size())));
  summary.p95     = lags[std::clamp<std::size_t>(rank, 1, lags.size()) - 1];
  return summary;
}

std::vector<session::FunctionTiming> TopFunctions(std::vector<session::FunctionTiming> timings, std::size_t limit) {
  std::stable_sort(timings.begin(), timings.end(),
                   [](const auto& a, const auto& b) { return a.cumulative_time > b.cumulative_time; });
  if (timings.size() > limit) {
    timings.resize(limit);
  }
  return timings;
}

bool HasWarnings(const ProfileStats& stats, util::Duration lag_threshold) {
  return !stats.blocking_calls.empty() || stats.event_loop_lag.max > lag_threshold || !stats.warnings.empty();
}

std::string Summarize(const ProfileStats& stats, util::Duration lag_threshold) {
  if (stats.backend == kNoBackend) {
    return "disabled";
  }

  std::string label;
  if (!stats.blocking_calls.empty()) {
    label = std::to_string(stats.blocking_calls.size()) + " blocking";
  }

  if (stats.event_loop_lag.sample_count > 0 && stats.event_loop_lag.max > lag_threshold) {
    char lag[32];
    std::snprintf(lag, sizeof(lag), "lag %.0fms", util::ToMillis(stats.event_loop_lag.max));
    if (!label.empty()) label += ", ";
    label += lag;
  }

  return label.empty() ? "OK" : label;
}

} // namespace asyncprof::model
