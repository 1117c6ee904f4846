#include "tester/scheduler.h"

#include <exception>
#include <string>
#include <utility>

#include "common/diagnostic.h"
#include "common/errors.h"
#include "sim/circuit.h"
#include "sim/simulator.h"
#include "tester/test_env.h"

namespace tandem {

namespace {

std::string Describe(const std::exception_ptr& ex) {
  try {
    std::rethrow_exception(ex);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

std::string JoinClockNames(const Circuit& circuit,
                           const std::vector<Signal>& clocks) {
  std::string out;
  for (Signal clock : clocks) {
    if (!out.empty()) out += ", ";
    out += "'" + circuit.ResolveName(clock) + "'";
  }
  return out;
}

}  // namespace

Scheduler::Scheduler(Simulator& sim, const Circuit& circuit, TestEnv& env,
                     SchedulerConfig config)
    : sim_(sim),
      circuit_(circuit),
      env_(env),
      config_(config),
      clocks_(sim, circuit),
      checker_(circuit, env.Diag()) {}

Scheduler::~Scheduler() {
  // Frames may hold objects whose destructors call back into the tester, so
  // they go before any member does.
  for (uint32_t i = 0; i < threads_.Size(); ++i) {
    threads_.At(i)->body.Reset();
  }
}

// --- Thread creation ---

TestThread* Scheduler::Fork(std::string name,
                            std::function<ThreadCoroutine()> factory) {
  return Register(threads_.Create(std::move(name), std::move(factory),
                                  current_));
}

TestThread* Scheduler::Fork(std::string name, ThreadCoroutine body) {
  return Register(threads_.Create(std::move(name), std::move(body), current_));
}

TestThread* Scheduler::Register(TestThread* thread) {
  checker_.AddThread(thread->id, CurrentThreadId(), thread->name);
  if (!thread->body.handle()) {
    // Empty body: nothing to run.
    thread->state = ThreadState::kDone;
    checker_.FinishThread(thread->id, Signal{});
    return thread;
  }
  switch (state_) {
    case SchedState::kRunningThreads:
      run_queue_.push_back(thread);
      break;
    case SchedState::kFinished:
      // Teardown cancels it without ever starting it.
      break;
    default:
      threads_.Block(thread, circuit_.Clock(), thread->resume_point);
      break;
  }
  return thread;
}

// --- Run loop ---

void Scheduler::Run(TestThread* main) {
  try {
    while (!main->Done()) {
      state_ = SchedState::kResolvingEdges;
      env_.Diag().SetTimestep(timestep_);
      auto unblocked = ResolveEdges();
      CheckProgress(!unblocked.empty());

      state_ = SchedState::kRunningThreads;
      RunThreads(std::move(unblocked));
      checker_.FinishTimestep();

      // The timestep that ends the test is validated but not committed.
      if (main->Done()) break;
      Commit();
      state_ = SchedState::kIdle;
    }
  } catch (...) {
    // A throwing hook or simulator still cancels every live thread.
    if (state_ != SchedState::kFinished) Teardown();
    throw;
  }
  Teardown();
}

std::vector<TestThread*> Scheduler::ResolveEdges() {
  // The main clock fires once per timestep by definition.
  Signal main_clock = circuit_.Clock();
  auto unblocked = threads_.TakeBlocked(main_clock);
  checker_.NewTimestep(main_clock);
  clocks_.CountEdge(main_clock);

  // Purge clocks nobody waits on any more.
  auto waited = threads_.BlockedClocks();
  clocks_.Retain(waited);
  for (Signal clock : waited) {
    if (!clocks_.IsTracked(clock)) {
      throw SchedulerError("threads wait on untracked clock '" +
                           circuit_.ResolveName(clock) + "'");
    }
  }

  for (Signal clock : clocks_.TrackedClocks()) {
    if (!clocks_.Rose(clock)) continue;
    auto released = threads_.TakeBlocked(clock);
    unblocked.insert(unblocked.end(), released.begin(), released.end());
    checker_.NewTimestep(clock);
    clocks_.CountEdge(clock);
  }
  return unblocked;
}

void Scheduler::CheckProgress(bool any_unblocked) {
  if (any_unblocked) {
    idle_timesteps_ = 0;
    return;
  }
  ++idle_timesteps_;
  auto waited = threads_.BlockedClocks();
  bool idle_limit = config_.deadlock_timesteps != 0 &&
                    idle_timesteps_ >= config_.deadlock_timesteps;
  if (!waited.empty() && !idle_limit) return;

  std::string msg;
  if (waited.empty()) {
    msg = "no thread is waiting on a clock, but the main thread has not "
          "finished";
  } else {
    msg = "no thread resumed for " + std::to_string(idle_timesteps_) +
          " timesteps; threads wait on " + JoinClockNames(circuit_, waited);
  }
  Diagnostic diag;
  diag.severity = DiagSeverity::kFatal;
  diag.kind = DiagKind::kDeadlock;
  diag.message = msg;
  env_.Diag().Report(std::move(diag));

  Teardown();
  throw DeadlockError(msg, timestep_);
}

void Scheduler::RunThreads(std::vector<TestThread*> unblocked) {
  run_queue_.assign(unblocked.begin(), unblocked.end());
  while (!run_queue_.empty()) {
    TestThread* thread = run_queue_.front();
    run_queue_.pop_front();
    ResumeThread(thread);
  }
}

void Scheduler::ResumeThread(TestThread* thread) {
  auto resume_point = std::exchange(thread->resume_point, nullptr);
  thread->state = ThreadState::kRunning;
  thread->started = true;
  current_ = thread;
  resume_point.resume();
  current_ = nullptr;

  if (thread->body.Done()) {
    OnThreadDone(thread);
    return;
  }
  if (thread->state == ThreadState::kRunning) {
    throw SchedulerError("thread '" + thread->name +
                         "' suspended outside a clock or join wait");
  }
}

void Scheduler::OnThreadDone(TestThread* thread) {
  thread->state = ThreadState::kDone;
  if (auto ex = thread->body.Exception()) {
    failures_.push_back(ex);
    Diagnostic diag;
    diag.severity = DiagSeverity::kError;
    diag.kind = DiagKind::kUserException;
    diag.message = "thread '" + thread->name + "' failed: " + Describe(ex);
    env_.Diag().Report(std::move(diag));
  }

  // Joiners carry on in this timestep, in the finished thread's window.
  for (auto* joiner : thread->joiners) {
    joiner->state = ThreadState::kReady;
    checker_.InheritWindow(joiner->id, thread->id);
    run_queue_.push_back(joiner);
  }
  thread->joiners.clear();
  checker_.FinishThread(thread->id, Signal{});

  // The record stays for joiners holding it. The frame and captures go now.
  thread->body.Reset();
  thread->factory = nullptr;
}

void Scheduler::Commit() {
  state_ = SchedState::kCommitting;
  env_.Checkpoint(timestep_);
  sim_.Step(1);
  ++timestep_;
}

// --- Teardown ---

void Scheduler::Teardown() {
  state_ = SchedState::kFinished;
  run_queue_.clear();
  threads_.ClearBlocked();
  // Index loop: cleanup code may fork.
  for (uint32_t i = 0; i < threads_.Size(); ++i) {
    TestThread* thread = threads_.At(i);
    if (!thread->Done()) Cancel(thread);
  }
}

void Scheduler::Cancel(TestThread* thread) {
  thread->cancel_requested = true;
  if (thread->started && thread->resume_point) {
    // The suspension point throws ThreadCancelled and the stack unwinds.
    auto resume_point = std::exchange(thread->resume_point, nullptr);
    current_ = thread;
    resume_point.resume();
    current_ = nullptr;
  }
  if (thread->body.Done()) {
    if (auto ex = thread->body.Exception()) {
      try {
        std::rethrow_exception(ex);
      } catch (const ThreadCancelled&) {
        // Expected outcome of the cancellation resume.
      } catch (...) {
        failures_.push_back(std::current_exception());
      }
    }
  }
  // Whatever is still suspended is destroyed with the frame.
  thread->body.Reset();
  thread->factory = nullptr;
  thread->state = ThreadState::kCancelled;
}

// --- Suspension requests ---

void Scheduler::BlockCurrent(Signal clock,
                             std::coroutine_handle<> resume_point) {
  if (!current_) {
    throw SchedulerError("clock wait issued outside a test thread");
  }
  checker_.FinishThread(current_->id, clock);
  if (clock != circuit_.Clock()) clocks_.Track(clock);
  threads_.Block(current_, clock, resume_point);
}

void Scheduler::JoinCurrent(TestThread* target,
                            std::coroutine_handle<> resume_point) {
  if (!current_) {
    throw SchedulerError("join issued outside a test thread");
  }
  current_->state = ThreadState::kJoining;
  current_->resume_point = resume_point;
  target->joiners.push_back(current_);
}

bool Scheduler::CancelRequested() const {
  return current_ && current_->cancel_requested;
}

void Scheduler::CheckCancelled() const {
  if (CancelRequested()) throw ThreadCancelled{};
}

std::vector<std::exception_ptr> Scheduler::TakeFailures() {
  return std::exchange(failures_, {});
}

}  // namespace tandem
