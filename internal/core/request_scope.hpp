#pragma once

#include "internal/core/profiler_coordinator.hpp"

namespace asyncprof::core {

/*
  Profiles one unit of work:

      core::RequestScope scope(profiler);
      co_await HandleRequest(loop, request);

  Stop() runs on every exit path, including unwinding and destruction of a
  cancelled coroutine frame that holds the scope.
*/
class RequestScope {
 public:
  explicit RequestScope(ProfilerCoordinator& coordinator) : coordinator_(coordinator) {
    coordinator_.Start();
  }

  ~RequestScope() {
    coordinator_.Stop();
  }

  RequestScope(const RequestScope&)            = delete;
  RequestScope& operator=(const RequestScope&) = delete;

 private:
  ProfilerCoordinator& coordinator_;
};

} // namespace asyncprof::core
