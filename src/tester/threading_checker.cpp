#include "tester/threading_checker.h"

#include <string>
#include <utility>

#include "common/diagnostic.h"
#include "sim/circuit.h"

namespace tandem {

ThreadingChecker::ThreadingChecker(const Circuit& circuit, DiagEngine& diag)
    : circuit_(circuit), diag_(diag) {}

// --- Thread bookkeeping ---

void ThreadingChecker::AddThread(ThreadId thread, ThreadId parent,
                                 std::string name) {
  thread_window_[thread] = WindowOf(parent);
  thread_names_[thread] = std::move(name);
}

void ThreadingChecker::InheritWindow(ThreadId thread, ThreadId from) {
  thread_window_[thread] = WindowOf(from);
}

void ThreadingChecker::FinishThread(ThreadId thread, Signal clock) {
  if (!clock.IsValid()) {
    thread_window_.erase(thread);
    // The name outlives the thread until this timestep's reports are out.
    retired_.push_back(thread);
    return;
  }
  thread_window_[thread] = clock;
}

Signal ThreadingChecker::WindowOf(ThreadId thread) const {
  auto it = thread_window_.find(thread);
  return it == thread_window_.end() ? circuit_.Clock() : it->second;
}

std::string ThreadingChecker::ThreadName(ThreadId thread) const {
  auto it = thread_names_.find(thread);
  if (it != thread_names_.end()) return it->second;
  if (thread == kNoThread) return "<no thread>";
  return "thread" + std::to_string(thread);
}

TimestepWindow& ThreadingChecker::WindowFor(ThreadId thread) {
  return windows_[WindowOf(thread)];
}

// --- Timestep bookkeeping ---

void ThreadingChecker::NewTimestep(Signal clock) {
  windows_[clock] = TimestepWindow{};
}

void ThreadingChecker::FinishTimestep() {
  for (const auto& [clock, window] : windows_) {
    CheckPeekOrdering(window);
  }
  windows_.clear();
  for (ThreadId thread : retired_) thread_names_.erase(thread);
  retired_.clear();
}

uint32_t ThreadingChecker::RecordCount() const {
  size_t n = 0;
  for (const auto& [clock, window] : windows_) {
    n += window.pokes.size() + window.peeks.size();
  }
  return static_cast<uint32_t>(n);
}

// --- Accesses ---

bool ThreadingChecker::DoPoke(Signal signal, SimValue value, int priority,
                              ThreadId issuer, SourceLoc loc) {
  auto& window = WindowFor(issuer);
  PokeRecord rec{signal, value, priority, issuer, seq_++, false, loc};

  auto it = window.dominant.find(signal);
  if (it != window.dominant.end()) {
    const PokeRecord& prev = window.pokes[it->second];
    // A thread's own re-poke keeps the strongest priority it has used.
    if (prev.thread == issuer && prev.priority < priority) {
      rec.priority = prev.priority;
    }
    if (prev.thread != issuer) {
      if (priority > prev.priority) {
        window.pokes.push_back(rec);
        return false;
      }
      if (priority == prev.priority) {
        ReportConflict("'" + ThreadName(issuer) + "' poked '" +
                           circuit_.ResolveName(signal) + "' at priority " +
                           std::to_string(priority) + ", already poked by '" +
                           ThreadName(prev.thread) +
                           "' at the same priority in this timestep",
                       loc, prev.loc);
        window.pokes.push_back(rec);
        return false;
      }
    }
  }

  rec.applied = true;
  window.dominant[signal] = window.pokes.size();
  window.pokes.push_back(rec);
  return true;
}

void ThreadingChecker::DoPeek(Signal signal, ThreadId issuer, SourceLoc loc) {
  WindowFor(issuer).peeks.push_back({signal, issuer, seq_++, loc});
}

void ThreadingChecker::CheckPeekOrdering(const TimestepWindow& window) {
  for (const auto& peek : window.peeks) {
    for (const auto& poke : window.pokes) {
      if (!poke.applied || poke.signal != peek.signal) continue;
      if (poke.thread == peek.thread || poke.seq < peek.seq) continue;
      ReportConflict("'" + ThreadName(peek.thread) + "' peeked '" +
                         circuit_.ResolveName(peek.signal) +
                         "' before '" + ThreadName(poke.thread) +
                         "' poked it in the same timestep",
                     peek.loc, poke.loc);
      break;
    }
  }
}

void ThreadingChecker::ReportConflict(std::string msg, SourceLoc loc,
                                      SourceLoc other) {
  ++conflicts_;
  Diagnostic diag;
  diag.severity = DiagSeverity::kError;
  diag.kind = DiagKind::kConflict;
  diag.loc = loc;
  diag.message = std::move(msg);
  diag.related.push_back(other);
  diag_.Report(std::move(diag));
}

}  // namespace tandem
