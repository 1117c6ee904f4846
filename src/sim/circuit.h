#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/types.h"

namespace tandem {

struct PortInfo {
  std::string name;
  PortKind kind = PortKind::kInput;
  uint32_t width = 1;
};

// =============================================================================
// Circuit: maps logical signal handles to simulator port names
// =============================================================================
//
// The main clock and the reset line are declared on construction. Passing an
// empty reset name declares a circuit without a reset port. After setup the
// map is only read.

class Circuit {
 public:
  explicit Circuit(std::string clock_port = "clock",
                   std::string reset_port = "reset");

  Signal AddInput(std::string name, uint32_t width = 1);
  Signal AddOutput(std::string name, uint32_t width = 1);
  // Dependent clock, sampled by the scheduler for rising edges.
  Signal AddClock(std::string name);

  Signal Clock() const { return clock_; }
  Signal Reset() const { return reset_; }

  // Invalid handle when no such port exists.
  Signal Find(std::string_view name) const;
  // Throws std::out_of_range when no such port exists.
  Signal Port(std::string_view name) const;

  const PortInfo& Info(Signal signal) const;
  std::string_view PortName(Signal signal) const;
  // Port name, or a readable placeholder for a handle this map never issued.
  std::string ResolveName(Signal signal) const;

  bool Contains(Signal signal) const {
    return signal.IsValid() && signal.id < ports_.size();
  }
  bool IsClock(Signal signal) const;
  uint32_t PortCount() const { return static_cast<uint32_t>(ports_.size()); }
  const std::vector<PortInfo>& Ports() const { return ports_; }

 private:
  Signal Declare(std::string name, PortKind kind, uint32_t width);

  std::vector<PortInfo> ports_;
  std::unordered_map<std::string, uint32_t> name_index_;
  Signal clock_;
  Signal reset_;
};

}  // namespace tandem
