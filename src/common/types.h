#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tandem {

// --- Signal values ---
// Pokes and peeks carry plain integers; width is the circuit's concern.

using SimValue = uint64_t;

// --- Port kinds ---

enum class PortKind : uint8_t {
  kInput,
  kOutput,
  kClock,
  kReset,
};

// --- Signal: logical handle to a circuit port ---

struct Signal {
  static constexpr uint32_t kInvalidId = UINT32_MAX;

  uint32_t id = kInvalidId;

  bool IsValid() const { return id != kInvalidId; }

  bool operator==(const Signal& o) const { return id == o.id; }
  bool operator!=(const Signal& o) const { return id != o.id; }
  bool operator<(const Signal& o) const { return id < o.id; }
};

struct SignalHash {
  size_t operator()(const Signal& s) const {
    return std::hash<uint32_t>{}(s.id);
  }
};

// --- Poke priorities ---
// Lower numbers dominate. A weak poke is a default driver that any regular
// poke from a concurrent thread overrides.

static constexpr int kDefaultPokePriority = 0;
static constexpr int kWeakPokePriority = 1;

// --- Thread identity ---

using ThreadId = uint32_t;

static constexpr ThreadId kNoThread = UINT32_MAX;

}  // namespace tandem
