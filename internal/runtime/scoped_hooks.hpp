#pragma once

#include "internal/runtime/event_loop.hpp"

namespace asyncprof::runtime {

/*
  RAII installers for the loop's replaceable primitives.

  Each one remembers exactly what was installed before it and puts that
  back on Restore() or destruction. Restore() reports a hook that was
  replaced behind our back (util::HookConflict) after restoring; the
  destructor only logs.
*/

class ScopedTaskFactory {
 public:
  ScopedTaskFactory(EventLoop& loop, TaskFactory factory);
  ~ScopedTaskFactory();

  ScopedTaskFactory(const ScopedTaskFactory&)            = delete;
  ScopedTaskFactory& operator=(const ScopedTaskFactory&) = delete;

  // The factory that was installed before us; wrappers delegate to it.
  const TaskFactoryPtr& Previous() const noexcept {
    return previous_;
  }

  bool Installed() const noexcept {
    return installed_ != nullptr;
  }

  void Restore();

 private:
  EventLoop&     loop_;
  TaskFactoryPtr previous_;
  TaskFactoryPtr installed_;
};

class ScopedSlowCallbackHook {
 public:
  ScopedSlowCallbackHook(EventLoop& loop, util::Duration threshold, SlowCallbackSinkPtr sink);
  ~ScopedSlowCallbackHook();

  ScopedSlowCallbackHook(const ScopedSlowCallbackHook&)            = delete;
  ScopedSlowCallbackHook& operator=(const ScopedSlowCallbackHook&) = delete;

  void Restore();

 private:
  EventLoop&          loop_;
  util::Duration      previous_threshold_;
  SlowCallbackSinkPtr previous_sink_;
  SlowCallbackSinkPtr installed_;
};

class ScopedTaskSwitchObserver {
 public:
  ScopedTaskSwitchObserver(EventLoop& loop, TaskSwitchObserverPtr observer);
  ~ScopedTaskSwitchObserver();

  ScopedTaskSwitchObserver(const ScopedTaskSwitchObserver&)            = delete;
  ScopedTaskSwitchObserver& operator=(const ScopedTaskSwitchObserver&) = delete;

  void Restore();

 private:
  EventLoop&            loop_;
  TaskSwitchObserverPtr previous_;
  TaskSwitchObserverPtr installed_;
};

} // namespace asyncprof::runtime
