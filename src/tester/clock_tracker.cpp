#include "tester/clock_tracker.h"

#include <algorithm>
#include <iterator>

#include "common/errors.h"
#include "sim/circuit.h"
#include "sim/simulator.h"

namespace tandem {

bool ClockTracker::Observe(Signal clock) {
  return (sim_.Peek(circuit_.PortName(clock)) & 1) != 0;
}

void ClockTracker::Track(Signal clock) {
  if (clock == circuit_.Clock()) {
    throw SchedulerError("the main clock is not sampled");
  }
  if (IsTracked(clock)) return;
  last_value_[clock] = Observe(clock);
}

bool ClockTracker::Rose(Signal clock) {
  auto it = last_value_.find(clock);
  if (it == last_value_.end()) {
    throw SchedulerError("clock '" + circuit_.ResolveName(clock) +
                         "' sampled without being tracked");
  }
  bool current = Observe(clock);
  bool rose = !it->second && current;
  it->second = current;
  return rose;
}

void ClockTracker::Retain(const std::vector<Signal>& referenced) {
  for (auto it = last_value_.begin(); it != last_value_.end();) {
    bool keep = std::find(referenced.begin(), referenced.end(), it->first) !=
                referenced.end();
    it = keep ? std::next(it) : last_value_.erase(it);
  }
}

std::vector<Signal> ClockTracker::TrackedClocks() const {
  std::vector<Signal> clocks;
  clocks.reserve(last_value_.size());
  for (const auto& [clock, value] : last_value_) {
    clocks.push_back(clock);
  }
  return clocks;
}

uint64_t ClockTracker::Cycles(Signal clock) const {
  auto it = edges_.find(clock);
  return it == edges_.end() ? 0 : it->second;
}

}  // namespace tandem
