#pragma once

#include <coroutine>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "common/types.h"

namespace tandem {

// --- Coroutine type for test threads and the routines they await ---
//
// Lazily started. Awaiting a ThreadCoroutine runs it as a subroutine of the
// awaiting coroutine, with symmetric transfer back to the caller when it
// finishes. A root coroutine owned by a TestThread returns to whoever
// resumed it, which is always the scheduler.

class ThreadCoroutine {
 public:
  struct promise_type {
    std::exception_ptr exception = nullptr;
    std::coroutine_handle<> continuation;

    ThreadCoroutine get_return_object() {
      return ThreadCoroutine{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    std::suspend_always initial_suspend() noexcept { return {}; }

    auto final_suspend() noexcept {
      struct Transfer {
        std::coroutine_handle<> cont;
        bool await_ready() noexcept { return false; }
        std::coroutine_handle<> await_suspend(
            std::coroutine_handle<>) noexcept {
          return cont ? cont : std::noop_coroutine();
        }
        void await_resume() noexcept {}
      };
      return Transfer{continuation};
    }

    void return_void() {}
    void unhandled_exception() { exception = std::current_exception(); }
  };

  using Handle = std::coroutine_handle<promise_type>;

  ThreadCoroutine() = default;
  explicit ThreadCoroutine(Handle h) : handle_(h) {}

  ThreadCoroutine(const ThreadCoroutine&) = delete;
  ThreadCoroutine& operator=(const ThreadCoroutine&) = delete;

  ThreadCoroutine(ThreadCoroutine&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
  }

  ThreadCoroutine& operator=(ThreadCoroutine&& other) noexcept {
    if (this != &other) {
      Destroy();
      handle_ = other.handle_;
      other.handle_ = nullptr;
    }
    return *this;
  }

  ~ThreadCoroutine() { Destroy(); }

  bool Done() const { return !handle_ || handle_.done(); }
  Handle handle() const { return handle_; }

  std::exception_ptr Exception() const {
    return handle_ ? handle_.promise().exception : nullptr;
  }

  // Destroys the frame, and with it every nested frame it is awaiting.
  void Reset() { Destroy(); }

  // Awaitable interface for co_await.
  bool await_ready() const noexcept { return Done(); }

  std::coroutine_handle<> await_suspend(
      std::coroutine_handle<> caller) noexcept {
    handle_.promise().continuation = caller;
    return handle_;  // Symmetric transfer to child.
  }

  void await_resume() const {
    if (handle_ && handle_.promise().exception) {
      std::rethrow_exception(handle_.promise().exception);
    }
  }

 private:
  void Destroy() {
    if (handle_) {
      handle_.destroy();
      handle_ = nullptr;
    }
  }

  Handle handle_ = nullptr;
};

// --- Thread lifecycle ---

enum class ThreadState : uint8_t {
  kReady,
  kRunning,
  kBlocked,
  kJoining,
  kDone,
  kCancelled,
};

// --- TestThread: one logical thread of test code ---

struct TestThread {
  ThreadId id = 0;
  std::string name;
  TestThread* parent = nullptr;
  ThreadState state = ThreadState::kReady;

  // Callable the body was created from. Owned here so a lambda's captures
  // outlive the coroutine frame that refers to them.
  std::function<ThreadCoroutine()> factory;
  ThreadCoroutine body;

  // Innermost suspended coroutine; what the scheduler resumes next.
  std::coroutine_handle<> resume_point;
  Signal blocked_on;
  std::vector<TestThread*> joiners;

  bool started = false;
  bool cancel_requested = false;

  bool Done() const {
    return state == ThreadState::kDone || state == ThreadState::kCancelled;
  }
};

}  // namespace tandem
