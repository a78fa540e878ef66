#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "asyncprof/v1.hpp"
#include "internal/backend/function_probe.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/core/profiler_coordinator.hpp"
#include "internal/core/request_scope.hpp"
#include "internal/model/stats_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/event_loop.hpp"

using asyncprof::core::ProfilerCoordinator;
using asyncprof::core::RequestScope;
using asyncprof::runtime::Coro;
using asyncprof::runtime::EventLoop;

namespace {

using namespace std::chrono_literals;

Coro LoadUser(EventLoop& loop, int id) {
  ASYNCPROF_PROBE_FUNCTION();
  co_await loop.Sleep(10ms);
  (void)id;
}

Coro RenderReport(EventLoop& loop) {
  ASYNCPROF_PROBE_FUNCTION();
  co_await loop.Sleep(40ms);
}

Coro CompressArchive(EventLoop& loop) {
  ASYNCPROF_PROBE_FUNCTION();
  co_await loop.Yield();
  // Holds the scheduler thread on purpose.
  std::this_thread::sleep_for(150ms);
}

Coro HandleRequest(EventLoop& loop) {
  ASYNCPROF_PROBE_FUNCTION();

  auto first   = ASYNCPROF_CREATE_TASK(loop, LoadUser(loop, 1), "load-user-1");
  auto second  = ASYNCPROF_CREATE_TASK(loop, LoadUser(loop, 2), "load-user-2");
  auto report  = ASYNCPROF_CREATE_TASK(loop, RenderReport(loop), "render-report");
  auto archive = ASYNCPROF_CREATE_TASK(loop, CompressArchive(loop), "compress-archive");

  co_await loop.Join(first);
  co_await loop.Join(second);
  co_await loop.Join(report);
  co_await loop.Join(archive);
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: asyncprof-demo [config.yaml] OR asyncprof-demo --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    asyncprof::v1::ProfilerConfig config;
    if (!config_path.empty()) {
      config = asyncprof::config::ConfigLoader::LoadFromYaml(config_path);
    }

    asyncprof::observability::InitializeLogging(config);
    auto settings = asyncprof::config::ResolveSettings(config);

    // ------------------------------------------------------------
    // Profile one request
    // ------------------------------------------------------------
    EventLoop           loop;
    ProfilerCoordinator profiler(loop, settings);
    {
      RequestScope scope(profiler);
      auto         request = ASYNCPROF_CREATE_TASK(loop, HandleRequest(loop), "request");
      loop.RunUntilComplete(request);
    }

    const auto stats = profiler.GetStats();
    ASYNCPROF_LOG_INFO("Request profiled", {asyncprof::observability::StringField("backend", stats.backend),
                                            asyncprof::observability::StringField("summary", profiler.Summary()),
                                            asyncprof::observability::StringField("server_timing", asyncprof::model::FormatServerTiming(stats))});

    std::cout << profiler.Summary() << std::endl;
    std::cout << asyncprof::model::ToJson(stats, profiler.Summary()) << std::endl;

    asyncprof::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ASYNCPROF_LOG_ERROR("Fatal error", {asyncprof::observability::StringField("error", e.what())});
    asyncprof::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
