#pragma once

#include "asyncprof/config/v1/config.pb.h"
#include "asyncprof/stats/v1/stats.pb.h"

namespace asyncprof::v1 {
using namespace ::asyncprof::config::v1;
using namespace ::asyncprof::stats::v1;
}
