#pragma once

#include <cstdint>
#include <string_view>

#include "common/types.h"

namespace tandem {

// Cycle-accurate circuit evaluator driven by the tester. Ports are addressed
// by the names a Circuit maps signals to. Step advances by whole cycles of
// the main clock; the engine has no notion of concurrent callers.
class Simulator {
 public:
  virtual ~Simulator() = default;

  virtual void Poke(std::string_view port, SimValue value) = 0;
  virtual SimValue Peek(std::string_view port) = 0;
  virtual void Step(uint32_t cycles) = 0;
};

}  // namespace tandem
