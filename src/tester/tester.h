#pragma once

#include <cstdint>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>

#include "common/types.h"
#include "tester/awaiters.h"
#include "tester/scheduler.h"
#include "tester/thread.h"

namespace tandem {

class Circuit;
class Simulator;
class TestEnv;

struct TesterOptions {
  // Cycles the reset line is held high before the test body starts.
  uint32_t reset_cycles = 1;
  // Consecutive timesteps in which no thread resumes before the run is
  // declared deadlocked. 0 disables the check; a run where no thread waits
  // on any clock is always a deadlock.
  uint32_t deadlock_timesteps = 1000;
  // Echo diagnostics to stderr as they are reported.
  bool echo_diagnostics = true;
};

// =============================================================================
// Tester: what test code talks to
// =============================================================================
//
// A test body is a coroutine. It pokes and peeks ports, waits for clock
// edges with `co_await t.Step(...)`, and forks further threads that run
// between the same clock edges:
//
//   tester.Run([&](Tester& t) -> ThreadCoroutine {
//     auto& drv = t.Fork([&]() -> ThreadCoroutine {
//       t.Poke(in, 1);
//       co_await t.Step();
//     });
//     co_await t.Join(drv);
//     t.Expect(out, 1);
//   });

class Tester {
 public:
  using TestBody = std::function<ThreadCoroutine(Tester&)>;

  Tester(Simulator& sim, const Circuit& circuit, TestEnv& env,
         TesterOptions options = {});

  // Holds reset, then runs `body` as the main thread until it finishes.
  // Threads still alive at that point are cancelled. Exceptions that escaped
  // any thread are rethrown afterwards: one as itself, several as
  // ThreadFailures. A stalled run throws DeadlockError.
  void Run(TestBody body);

  void Poke(Signal signal, SimValue value,
            int priority = kDefaultPokePriority,
            std::source_location loc = std::source_location::current());
  // Default-driver poke; any regular poke in the same timestep overrides it.
  void WeakPoke(Signal signal, SimValue value,
                std::source_location loc = std::source_location::current());
  // Stale peeks are not supported and throw StaleReadError.
  SimValue Peek(Signal signal, bool stale = false,
                std::source_location loc = std::source_location::current());
  // Peeks and compares. A mismatch is recorded, the thread carries on.
  bool Expect(Signal signal, SimValue expected, std::string_view message = {},
              std::source_location loc = std::source_location::current());

  // Waits for `cycles` rising edges of the main clock or of `clock`.
  ThreadCoroutine Step(uint32_t cycles = 1);
  ThreadCoroutine Step(Signal clock, uint32_t cycles = 1);

  TestThread& Fork(std::function<ThreadCoroutine()> body,
                   std::string name = {});
  TestThread& Fork(ThreadCoroutine body, std::string name = {});
  JoinAwaiter Join(TestThread& thread);

  const Circuit& Dut() const { return circuit_; }
  TestEnv& Env() { return env_; }
  Scheduler& GetScheduler() { return scheduler_; }
  uint64_t Timestep() const { return scheduler_.Timestep(); }
  uint64_t ClockCycles(Signal clock) const {
    return scheduler_.ClockCycles(clock);
  }

 private:
  void ResetCircuit();

  Simulator& sim_;
  const Circuit& circuit_;
  TestEnv& env_;
  TesterOptions options_;
  Scheduler scheduler_;
  TestBody body_;
  bool ran_ = false;
};

}  // namespace tandem
