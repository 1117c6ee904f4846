#pragma once

#include <cstdint>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.h"
#include "tester/test_env.h"

namespace tandem {

class Circuit;
class Simulator;

/// VCD signal entry: maps a circuit port to a VCD identifier.
struct VcdSignal {
  Signal signal;
  std::string name;
  uint32_t width = 1;
  std::string ident;
  SimValue last = 0;
};

/// Waveform dump driven by the checkpoint hook. Each committed timestep
/// samples the registered ports through the simulator, outside the
/// threading checker, and writes the values that changed.
class VcdWriter {
 public:
  explicit VcdWriter(const std::string& filename);
  explicit VcdWriter(std::ostream& out);

  VcdWriter(const VcdWriter&) = delete;
  VcdWriter& operator=(const VcdWriter&) = delete;

  bool IsOpen() const { return out_ != nullptr && out_->good(); }

  void WriteHeader(std::string_view timescale);
  void BeginScope(std::string_view name);
  void EndScope();
  void RegisterSignal(Signal signal, std::string_view name, uint32_t width);
  // Registers every port of the circuit inside one module scope.
  void RegisterCircuit(const Circuit& circuit, std::string_view scope);
  void EndDefinitions();

  void Sample(uint64_t time, Simulator& sim, const Circuit& circuit);

  // Hook for TestEnv::SetCheckpoint. The writer, simulator and circuit must
  // outlive the run.
  CheckpointHook MakeCheckpoint(Simulator& sim, const Circuit& circuit);

  uint32_t SignalCount() const {
    return static_cast<uint32_t>(signals_.size());
  }

 private:
  std::string NextIdent();
  void WriteSignalChange(const VcdSignal& sig);

  std::ofstream file_;
  std::ostream* out_ = nullptr;
  std::vector<VcdSignal> signals_;
  uint32_t next_ident_ = 0;
  bool dumped_ = false;
};

}  // namespace tandem
