#include "time.hpp"

namespace asyncprof::util {

TimePoint Now() {
  return Clock::now();
}

Duration FromProto(const google::protobuf::Duration& d) {
  return std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());
}

double ToMillis(Duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace asyncprof::util
