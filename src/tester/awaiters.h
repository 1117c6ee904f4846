#pragma once

#include <coroutine>

#include "common/types.h"
#include "tester/scheduler.h"
#include "tester/thread.h"

namespace tandem {

// Awaiter for one rising edge of a clock. Parks the running thread in the
// clock's blocked-set bucket; the scheduler resumes it after the edge. Once
// the run is tearing the thread down, the wait does not suspend and throws
// ThreadCancelled instead.
struct ClockAwaiter {
  Scheduler& sched;
  Signal clock;

  bool await_ready() const noexcept { return sched.CancelRequested(); }

  void await_suspend(std::coroutine_handle<> h) {
    sched.BlockCurrent(clock, h);
  }

  void await_resume() const { sched.CheckCancelled(); }
};

// Awaiter that suspends the running thread until another thread finishes.
struct JoinAwaiter {
  Scheduler& sched;
  TestThread* target;

  bool await_ready() const noexcept {
    return target->Done() || sched.CancelRequested();
  }

  void await_suspend(std::coroutine_handle<> h) {
    sched.JoinCurrent(target, h);
  }

  void await_resume() const { sched.CheckCancelled(); }
};

}  // namespace tandem
