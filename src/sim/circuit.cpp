#include "sim/circuit.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace tandem {

Circuit::Circuit(std::string clock_port, std::string reset_port) {
  clock_ = Declare(std::move(clock_port), PortKind::kClock, 1);
  if (!reset_port.empty()) {
    reset_ = Declare(std::move(reset_port), PortKind::kReset, 1);
  }
}

Signal Circuit::AddInput(std::string name, uint32_t width) {
  return Declare(std::move(name), PortKind::kInput, width);
}

Signal Circuit::AddOutput(std::string name, uint32_t width) {
  return Declare(std::move(name), PortKind::kOutput, width);
}

Signal Circuit::AddClock(std::string name) {
  return Declare(std::move(name), PortKind::kClock, 1);
}

Signal Circuit::Declare(std::string name, PortKind kind, uint32_t width) {
  if (name.empty()) {
    throw std::invalid_argument("port name must not be empty");
  }
  if (name_index_.count(name) != 0) {
    throw std::invalid_argument("duplicate port '" + name + "'");
  }
  Signal sig{static_cast<uint32_t>(ports_.size())};
  name_index_.emplace(name, sig.id);
  ports_.push_back({std::move(name), kind, width});
  return sig;
}

Signal Circuit::Find(std::string_view name) const {
  auto it = name_index_.find(std::string(name));
  if (it == name_index_.end()) return {};
  return Signal{it->second};
}

Signal Circuit::Port(std::string_view name) const {
  Signal sig = Find(name);
  if (!sig.IsValid()) {
    throw std::out_of_range("no port named '" + std::string(name) + "'");
  }
  return sig;
}

const PortInfo& Circuit::Info(Signal signal) const {
  if (!Contains(signal)) {
    throw std::out_of_range("unknown signal " + ResolveName(signal));
  }
  return ports_[signal.id];
}

std::string_view Circuit::PortName(Signal signal) const {
  return Info(signal).name;
}

std::string Circuit::ResolveName(Signal signal) const {
  if (Contains(signal)) return ports_[signal.id].name;
  if (!signal.IsValid()) return "<invalid signal>";
  return "<signal #" + std::to_string(signal.id) + ">";
}

bool Circuit::IsClock(Signal signal) const {
  return Contains(signal) && ports_[signal.id].kind == PortKind::kClock;
}

}  // namespace tandem
