#pragma once

#include <coroutine>
#include <exception>
#include <utility>

namespace asyncprof::runtime {

/*
  Coro

  Return type of every coroutine the event loop can run as a Task.
  The body does not start until the loop steps the task for the first time;
  an exception escaping the body is kept in the promise and classified by
  the task (CancelledError → cancelled, anything else → failed).

      runtime::Coro FetchUser(runtime::EventLoop& loop) {
        co_await loop.Sleep(std::chrono::milliseconds(10));
      }
*/
class Coro {
 public:
  struct promise_type {
    Coro get_return_object() noexcept {
      return Coro{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() const noexcept {
      return {};
    }

    std::suspend_always final_suspend() const noexcept {
      return {};
    }

    void return_void() const noexcept {
    }

    void unhandled_exception() noexcept {
      exception = std::current_exception();
    }

    std::exception_ptr exception;
  };

  using Handle = std::coroutine_handle<promise_type>;

  Coro(Coro&& other) noexcept : handle_(std::exchange(other.handle_, {})) {
  }

  Coro& operator=(Coro&& other) noexcept {
    if (this != &other) {
      Reset();
      handle_ = std::exchange(other.handle_, {});
    }
    return *this;
  }

  Coro(const Coro&)            = delete;
  Coro& operator=(const Coro&) = delete;

  ~Coro() {
    Reset();
  }

  bool Valid() const noexcept {
    return static_cast<bool>(handle_);
  }

  // Transfers frame ownership to the caller.
  Handle Release() noexcept {
    return std::exchange(handle_, {});
  }

 private:
  explicit Coro(Handle handle) noexcept : handle_(handle) {
  }

  void Reset() noexcept {
    if (handle_) {
      handle_.destroy();
      handle_ = {};
    }
  }

  Handle handle_;
};

} // namespace asyncprof::runtime
