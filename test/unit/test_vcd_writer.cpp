#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>

#include "common/types.h"
#include "fake_simulator.h"
#include "sim/circuit.h"
#include "tester/test_env.h"
#include "tester/tester.h"
#include "tester/vcd_writer.h"

using namespace tandem;

namespace {

struct VcdFixture {
  Circuit circuit;
  Signal in = circuit.AddInput("in", 8);
  FakeSimulator sim;
  std::ostringstream out;
  VcdWriter vcd{out};

  VcdFixture() {
    sim.AddPort("clock");
    sim.AddPort("reset");
    sim.AddPort("in");
  }
};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

// =============================================================================
// Definitions
// =============================================================================

TEST(VcdWriter, HeaderListsEveryPort) {
  VcdFixture f;
  f.vcd.WriteHeader("1ns");
  f.vcd.RegisterCircuit(f.circuit, "dut");
  f.vcd.EndDefinitions();

  std::string text = f.out.str();
  EXPECT_TRUE(Contains(text, "$timescale 1ns $end"));
  EXPECT_TRUE(Contains(text, "$scope module dut $end"));
  EXPECT_TRUE(Contains(text, "$var wire 1 ! clock $end"));
  EXPECT_TRUE(Contains(text, "$var wire 1 \" reset $end"));
  EXPECT_TRUE(Contains(text, "$var wire 8 # in $end"));
  EXPECT_TRUE(Contains(text, "$upscope $end"));
  EXPECT_TRUE(Contains(text, "$enddefinitions $end"));
  EXPECT_EQ(f.vcd.SignalCount(), 3u);
}

TEST(VcdWriter, IdentifiersGrowPastOneCharacter) {
  VcdFixture f;
  for (uint32_t i = 0; i < 95; ++i) {
    f.vcd.RegisterSignal(Signal{i}, "s" + std::to_string(i), 1);
  }
  EXPECT_TRUE(Contains(f.out.str(), "$var wire 1 ~ s93 $end"));
  EXPECT_TRUE(Contains(f.out.str(), "$var wire 1 !\" s94 $end"));
}

TEST(VcdWriter, UnopenedFileWritesNothing) {
  VcdWriter vcd("/nonexistent-dir/wave.vcd");
  EXPECT_FALSE(vcd.IsOpen());
  FakeSimulator sim;
  Circuit circuit;
  vcd.RegisterCircuit(circuit, "dut");
  EXPECT_NO_THROW(vcd.Sample(0, sim, circuit));
}

// =============================================================================
// Value changes
// =============================================================================

TEST(VcdWriter, FirstSampleDumpsEverythingThenOnlyChanges) {
  VcdFixture f;
  f.vcd.RegisterCircuit(f.circuit, "dut");
  f.vcd.EndDefinitions();
  f.out.str("");

  f.sim.Poke("in", 3);
  f.vcd.Sample(0, f.sim, f.circuit);
  f.vcd.Sample(1, f.sim, f.circuit);
  f.sim.Poke("in", 4);
  f.sim.Poke("reset", 1);
  f.vcd.Sample(2, f.sim, f.circuit);

  EXPECT_EQ(f.out.str(),
            "#0\n0!\n0\"\nb00000011 #\n"
            "#2\n1\"\nb00000100 #\n");
}

TEST(VcdWriter, CheckpointHookSamplesEachCommittedTimestep) {
  VcdFixture f;
  TestEnv env;
  TesterOptions options;
  options.echo_diagnostics = false;
  Tester tester(f.sim, f.circuit, env, options);

  f.vcd.RegisterCircuit(f.circuit, "dut");
  f.vcd.EndDefinitions();
  f.out.str("");
  env.SetCheckpoint(f.vcd.MakeCheckpoint(f.sim, f.circuit));

  tester.Run([&](Tester& t) -> ThreadCoroutine {
    t.Poke(f.in, 1);
    co_await t.Step();
    co_await t.Step();
    t.Poke(f.in, 2);
    co_await t.Step();
  });

  std::string text = f.out.str();
  EXPECT_TRUE(Contains(text, "#0\n"));
  EXPECT_FALSE(Contains(text, "#1\n"));
  EXPECT_TRUE(Contains(text, "#2\nb00000010 #\n"));
  EXPECT_FALSE(Contains(text, "#3\n"));
}
