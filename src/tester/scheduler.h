#pragma once

#include <coroutine>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "common/types.h"
#include "tester/clock_tracker.h"
#include "tester/thread.h"
#include "tester/thread_registry.h"
#include "tester/threading_checker.h"

namespace tandem {

class Circuit;
class Simulator;
class TestEnv;

// --- Run loop states ---

enum class SchedState : uint8_t {
  kIdle,
  kResolvingEdges,
  kRunningThreads,
  kCommitting,
  kFinished,
};

struct SchedulerConfig {
  // Consecutive timesteps with nothing to resume before the run is declared
  // deadlocked. 0 disables the check.
  uint32_t deadlock_timesteps = 1000;
};

// =============================================================================
// Scheduler: advances the simulation one main-clock edge at a time
// =============================================================================
//
// Each timestep collects the threads waiting on the main clock and on every
// dependent clock that rose, resumes them one at a time in blocked-set order
// until each waits again or finishes, validates the timestep, then steps the
// simulator exactly once. Exactly one thread executes at any instant; the
// blocked set, clock table and checker log are only touched from here.

class Scheduler {
 public:
  Scheduler(Simulator& sim, const Circuit& circuit, TestEnv& env,
            SchedulerConfig config = {});
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Registers a thread. Inside the loop it runs later in the current
  // timestep; outside it starts on the first timestep. Never suspends the
  // caller and never steps the simulator.
  TestThread* Fork(std::string name, std::function<ThreadCoroutine()> factory);
  TestThread* Fork(std::string name, ThreadCoroutine body);

  // Loops until `main` is done, then cancels every remaining thread. Throws
  // DeadlockError if the run stops making progress.
  void Run(TestThread* main);

  // Suspension requests from the running thread (see awaiters.h).
  void BlockCurrent(Signal clock, std::coroutine_handle<> resume_point);
  void JoinCurrent(TestThread* target, std::coroutine_handle<> resume_point);
  bool CancelRequested() const;
  void CheckCancelled() const;

  TestThread* CurrentThread() const { return current_; }
  ThreadId CurrentThreadId() const {
    return current_ ? current_->id : kNoThread;
  }
  SchedState State() const { return state_; }
  uint64_t Timestep() const { return timestep_; }
  uint64_t ClockCycles(Signal clock) const { return clocks_.Cycles(clock); }

  // Exceptions that escaped thread bodies, in the order threads failed.
  std::vector<std::exception_ptr> TakeFailures();

  ThreadRegistry& Threads() { return threads_; }
  const ThreadRegistry& Threads() const { return threads_; }
  ClockTracker& Clocks() { return clocks_; }
  ThreadingChecker& Checker() { return checker_; }

 private:
  TestThread* Register(TestThread* thread);
  std::vector<TestThread*> ResolveEdges();
  void RunThreads(std::vector<TestThread*> unblocked);
  void ResumeThread(TestThread* thread);
  void OnThreadDone(TestThread* thread);
  void CheckProgress(bool any_unblocked);
  void Commit();
  void Teardown();
  void Cancel(TestThread* thread);

  Simulator& sim_;
  const Circuit& circuit_;
  TestEnv& env_;
  SchedulerConfig config_;

  ThreadRegistry threads_;
  ClockTracker clocks_;
  ThreadingChecker checker_;

  std::deque<TestThread*> run_queue_;
  std::vector<std::exception_ptr> failures_;
  TestThread* current_ = nullptr;
  SchedState state_ = SchedState::kIdle;
  uint64_t timestep_ = 0;
  uint32_t idle_timesteps_ = 0;
};

}  // namespace tandem
