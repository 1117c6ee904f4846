#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "common/types.h"

namespace tandem {

class Circuit;
class Simulator;

// =============================================================================
// ClockTracker: samples dependent clocks for rising edges
// =============================================================================
//
// Only clocks some thread is waiting on are tracked, so the table is bounded
// by what the test waits on rather than by the clocks in the circuit. The
// main clock is never tracked: the scheduler steps it and it rises exactly
// once per timestep by construction. Edge counters outlive the tracked
// values so a clock keeps its cycle count across periods nobody waits on it.

class ClockTracker {
 public:
  ClockTracker(Simulator& sim, const Circuit& circuit)
      : sim_(sim), circuit_(circuit) {}

  // Current level of the clock port (bit 0 of the peeked value).
  bool Observe(Signal clock);

  // Starts tracking from the clock's current level. No-op if tracked.
  void Track(Signal clock);

  // True iff the recorded level was low and the observed level is high.
  // Records the observed level either way.
  bool Rose(Signal clock);

  // Drops every tracked clock not in `referenced`.
  void Retain(const std::vector<Signal>& referenced);

  bool IsTracked(Signal clock) const { return last_value_.count(clock) != 0; }
  uint32_t TrackedCount() const {
    return static_cast<uint32_t>(last_value_.size());
  }
  std::vector<Signal> TrackedClocks() const;

  void CountEdge(Signal clock) { ++edges_[clock]; }
  uint64_t Cycles(Signal clock) const;

 private:
  Simulator& sim_;
  const Circuit& circuit_;
  std::map<Signal, bool> last_value_;
  std::map<Signal, uint64_t> edges_;
};

}  // namespace tandem
