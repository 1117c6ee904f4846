#include "tester/tester.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/diagnostic.h"
#include "common/errors.h"
#include "sim/circuit.h"
#include "sim/simulator.h"
#include "tester/test_env.h"

namespace tandem {

namespace {

void RethrowFailures(std::vector<std::exception_ptr> failures) {
  if (failures.empty()) return;
  if (failures.size() == 1) std::rethrow_exception(failures.front());
  auto n = failures.size();
  throw ThreadFailures(std::to_string(n) + " test threads failed",
                       std::move(failures));
}

}  // namespace

Tester::Tester(Simulator& sim, const Circuit& circuit, TestEnv& env,
               TesterOptions options)
    : sim_(sim),
      circuit_(circuit),
      env_(env),
      options_(options),
      scheduler_(sim, circuit, env,
                 SchedulerConfig{options.deadlock_timesteps}) {
  env_.Diag().SetEcho(options_.echo_diagnostics);
}

// --- Run ---

void Tester::Run(TestBody body) {
  if (ran_) {
    throw std::logic_error("a Tester runs a single test");
  }
  ran_ = true;
  body_ = std::move(body);

  ResetCircuit();
  TestThread* main =
      scheduler_.Fork("main", [this]() { return body_(*this); });

  // Deadlocks and hook or simulator errors are reported after the thread
  // failures that preceded them.
  std::exception_ptr run_error;
  try {
    scheduler_.Run(main);
  } catch (const std::exception&) {
    run_error = std::current_exception();
  }
  auto failures = scheduler_.TakeFailures();
  if (run_error) failures.push_back(run_error);
  RethrowFailures(std::move(failures));
}

void Tester::ResetCircuit() {
  Signal reset = circuit_.Reset();
  if (!reset.IsValid() || options_.reset_cycles == 0) return;
  auto port = circuit_.PortName(reset);
  sim_.Poke(port, 1);
  sim_.Step(options_.reset_cycles);
  sim_.Poke(port, 0);
}

// --- Signal access ---

void Tester::Poke(Signal signal, SimValue value, int priority,
                  std::source_location loc) {
  auto port = circuit_.PortName(signal);
  if (scheduler_.Checker().DoPoke(signal, value, priority,
                                  scheduler_.CurrentThreadId(),
                                  SourceLoc::From(loc))) {
    sim_.Poke(port, value);
  }
}

void Tester::WeakPoke(Signal signal, SimValue value,
                      std::source_location loc) {
  Poke(signal, value, kWeakPokePriority, loc);
}

SimValue Tester::Peek(Signal signal, bool stale, std::source_location loc) {
  auto port = circuit_.PortName(signal);
  if (stale) {
    std::string msg = "stale peek of '" + std::string(port) +
                      "' requested; stale peeks are not supported";
    Diagnostic diag;
    diag.severity = DiagSeverity::kError;
    diag.kind = DiagKind::kStaleRead;
    diag.loc = SourceLoc::From(loc);
    diag.message = msg;
    env_.Diag().Report(std::move(diag));
    throw StaleReadError(msg);
  }
  scheduler_.Checker().DoPeek(signal, scheduler_.CurrentThreadId(),
                              SourceLoc::From(loc));
  return sim_.Peek(port);
}

bool Tester::Expect(Signal signal, SimValue expected, std::string_view message,
                    std::source_location loc) {
  SimValue actual = Peek(signal, false, loc);
  return env_.Expect(expected, actual, circuit_.ResolveName(signal), message,
                     SourceLoc::From(loc));
}

// --- Threads ---

ThreadCoroutine Tester::Step(uint32_t cycles) {
  return Step(circuit_.Clock(), cycles);
}

ThreadCoroutine Tester::Step(Signal clock, uint32_t cycles) {
  if (!circuit_.IsClock(clock)) {
    throw std::invalid_argument("cannot step '" + circuit_.ResolveName(clock) +
                                "': not a clock");
  }
  for (uint32_t i = 0; i < cycles; ++i) {
    co_await ClockAwaiter{scheduler_, clock};
  }
}

TestThread& Tester::Fork(std::function<ThreadCoroutine()> body,
                         std::string name) {
  return *scheduler_.Fork(std::move(name), std::move(body));
}

TestThread& Tester::Fork(ThreadCoroutine body, std::string name) {
  return *scheduler_.Fork(std::move(name), std::move(body));
}

JoinAwaiter Tester::Join(TestThread& thread) {
  if (&thread == scheduler_.CurrentThread()) {
    throw std::invalid_argument("thread '" + thread.name +
                                "' cannot join itself");
  }
  return JoinAwaiter{scheduler_, &thread};
}

}  // namespace tandem
