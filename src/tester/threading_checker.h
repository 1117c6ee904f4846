#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/source_loc.h"
#include "common/types.h"

namespace tandem {

class Circuit;
class DiagEngine;

struct PokeRecord {
  Signal signal;
  SimValue value = 0;
  int priority = kDefaultPokePriority;
  ThreadId thread = kNoThread;
  uint64_t seq = 0;
  bool applied = false;
  SourceLoc loc;
};

struct PeekRecord {
  Signal signal;
  ThreadId thread = kNoThread;
  uint64_t seq = 0;
  SourceLoc loc;
};

// Accesses made within one timestep by threads gated on one clock. Threads
// in different windows are not concurrent with each other.
struct TimestepWindow {
  std::vector<PokeRecord> pokes;
  std::vector<PeekRecord> peeks;
  // Signal -> index of the poke currently in effect.
  std::unordered_map<Signal, size_t, SignalHash> dominant;
};

// =============================================================================
// ThreadingChecker: per-timestep poke arbitration and ordering checks
// =============================================================================
//
// Every poke and peek issued by a thread passes through here. Pokes to the
// same signal in the same window are arbitrated by priority: the lower
// number wins, and equal priorities from two threads are a conflict. At the
// end of the timestep, a peek that an applied poke from another thread
// overrode later in the same window is reported as a conflict too.

class ThreadingChecker {
 public:
  ThreadingChecker(const Circuit& circuit, DiagEngine& diag);

  // A new thread starts in its parent's window.
  void AddThread(ThreadId thread, ThreadId parent, std::string name);
  void InheritWindow(ThreadId thread, ThreadId from);

  // Opens a fresh window for the threads the clock's edge releases.
  void NewTimestep(Signal clock);

  // Records a poke. Returns whether the caller should apply it.
  bool DoPoke(Signal signal, SimValue value, int priority, ThreadId issuer,
              SourceLoc loc);
  void DoPeek(Signal signal, ThreadId issuer, SourceLoc loc);

  // Thread is about to wait on `clock` and resumes in its window. An invalid
  // clock means the thread finished.
  void FinishThread(ThreadId thread, Signal clock);

  // Runs the ordering checks and clears the log.
  void FinishTimestep();

  Signal WindowOf(ThreadId thread) const;
  bool IsWindowOpen(Signal clock) const { return windows_.count(clock) != 0; }
  uint32_t ConflictCount() const { return conflicts_; }
  uint32_t RecordCount() const;
  size_t NamedThreadCount() const { return thread_names_.size(); }

 private:
  TimestepWindow& WindowFor(ThreadId thread);
  std::string ThreadName(ThreadId thread) const;
  void ReportConflict(std::string msg, SourceLoc loc, SourceLoc other);
  void CheckPeekOrdering(const TimestepWindow& window);

  const Circuit& circuit_;
  DiagEngine& diag_;
  std::map<Signal, TimestepWindow> windows_;
  std::unordered_map<ThreadId, Signal> thread_window_;
  std::unordered_map<ThreadId, std::string> thread_names_;
  std::vector<ThreadId> retired_;
  uint64_t seq_ = 0;
  uint32_t conflicts_ = 0;
};

}  // namespace tandem
