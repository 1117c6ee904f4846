#include "tester/vcd_writer.h"

#include <string>
#include <utility>

#include "sim/circuit.h"
#include "sim/simulator.h"

namespace tandem {

VcdWriter::VcdWriter(const std::string& filename) : file_(filename) {
  if (file_.is_open()) out_ = &file_;
}

VcdWriter::VcdWriter(std::ostream& out) : out_(&out) {}

// --- Definitions ---

void VcdWriter::WriteHeader(std::string_view timescale) {
  if (!out_) return;
  *out_ << "$version tandem $end\n";
  *out_ << "$timescale " << timescale << " $end\n";
}

void VcdWriter::BeginScope(std::string_view name) {
  if (!out_) return;
  *out_ << "$scope module " << name << " $end\n";
}

void VcdWriter::EndScope() {
  if (!out_) return;
  *out_ << "$upscope $end\n";
}

void VcdWriter::RegisterSignal(Signal signal, std::string_view name,
                               uint32_t width) {
  VcdSignal sig{signal, std::string(name), width, NextIdent(), 0};
  if (out_) {
    *out_ << "$var wire " << width << " " << sig.ident << " " << name
          << " $end\n";
  }
  signals_.push_back(std::move(sig));
}

void VcdWriter::RegisterCircuit(const Circuit& circuit,
                                std::string_view scope) {
  BeginScope(scope);
  for (uint32_t i = 0; i < circuit.PortCount(); ++i) {
    const auto& port = circuit.Ports()[i];
    RegisterSignal(Signal{i}, port.name, port.width);
  }
  EndScope();
}

void VcdWriter::EndDefinitions() {
  if (!out_) return;
  *out_ << "$enddefinitions $end\n";
}

// VCD identifiers use the printable range '!'..'~', base 94.
std::string VcdWriter::NextIdent() {
  std::string ident;
  uint32_t n = next_ident_++;
  do {
    ident += static_cast<char>('!' + n % 94);
    n /= 94;
  } while (n != 0);
  return ident;
}

// --- Value changes ---

void VcdWriter::Sample(uint64_t time, Simulator& sim, const Circuit& circuit) {
  if (!out_) return;
  bool stamped = false;
  for (auto& sig : signals_) {
    SimValue value = sim.Peek(circuit.PortName(sig.signal));
    if (dumped_ && value == sig.last) continue;
    sig.last = value;
    if (!stamped) {
      *out_ << "#" << time << "\n";
      stamped = true;
    }
    WriteSignalChange(sig);
  }
  dumped_ = true;
}

void VcdWriter::WriteSignalChange(const VcdSignal& sig) {
  if (sig.width == 1) {
    *out_ << ((sig.last & 1) ? '1' : '0') << sig.ident << "\n";
    return;
  }
  std::string bits;
  for (uint32_t i = sig.width; i > 0; --i) {
    uint32_t bit = i - 1;
    bits += (bit < 64 && ((sig.last >> bit) & 1)) ? '1' : '0';
  }
  *out_ << "b" << bits << " " << sig.ident << "\n";
}

CheckpointHook VcdWriter::MakeCheckpoint(Simulator& sim,
                                         const Circuit& circuit) {
  return [this, &sim, &circuit](uint64_t timestep) {
    Sample(timestep, sim, circuit);
  };
}

}  // namespace tandem
