#include <gtest/gtest.h>

#include <vector>

#include "common/errors.h"
#include "common/types.h"
#include "fake_simulator.h"
#include "sim/circuit.h"
#include "tester/clock_tracker.h"

using namespace tandem;

namespace {

struct ClockFixture {
  Circuit circuit;
  Signal clk_b = circuit.AddClock("clk_b");
  Signal clk_c = circuit.AddClock("clk_c");
  FakeSimulator sim;
  ClockTracker clocks{sim, circuit};

  ClockFixture() {
    sim.AddPort("clock");
    sim.AddPort("reset");
    sim.AddDividedClock("clk_b", 1);
    sim.AddDividedClock("clk_c", 2);
  }
};

}  // namespace

// =============================================================================
// Edge detection
// =============================================================================

TEST(ClockTracker, RoseOnlyOnLowToHigh) {
  ClockFixture f;
  f.clocks.Track(f.clk_b);
  ASSERT_TRUE(f.clocks.IsTracked(f.clk_b));

  f.sim.Step(1);  // 0 -> 1
  EXPECT_TRUE(f.clocks.Rose(f.clk_b));
  EXPECT_FALSE(f.clocks.Rose(f.clk_b));  // 1 -> 1
  f.sim.Step(1);  // 1 -> 0
  EXPECT_FALSE(f.clocks.Rose(f.clk_b));
  f.sim.Step(1);  // 0 -> 1
  EXPECT_TRUE(f.clocks.Rose(f.clk_b));
}

TEST(ClockTracker, SlowerClockRisesEveryFourCycles) {
  ClockFixture f;
  f.clocks.Track(f.clk_c);
  std::vector<bool> rises;
  for (int i = 0; i < 8; ++i) {
    f.sim.Step(1);
    rises.push_back(f.clocks.Rose(f.clk_c));
  }
  std::vector<bool> expected = {false, true,  false, false,
                                false, true,  false, false};
  EXPECT_EQ(rises, expected);
}

TEST(ClockTracker, TrackStartsFromCurrentLevel) {
  ClockFixture f;
  f.sim.Step(1);  // clk_b high before anyone tracks it
  f.clocks.Track(f.clk_b);
  EXPECT_FALSE(f.clocks.Rose(f.clk_b));
}

TEST(ClockTracker, TrackTwiceKeepsRecordedLevel) {
  ClockFixture f;
  f.clocks.Track(f.clk_b);
  f.sim.Step(1);
  f.clocks.Track(f.clk_b);  // no-op; the low level is still recorded
  EXPECT_TRUE(f.clocks.Rose(f.clk_b));
}

TEST(ClockTracker, ObserveUsesLowBit) {
  ClockFixture f;
  f.sim.Poke("clk_b", 2);
  EXPECT_FALSE(f.clocks.Observe(f.clk_b));
  f.sim.Poke("clk_b", 3);
  EXPECT_TRUE(f.clocks.Observe(f.clk_b));
}

TEST(ClockTracker, RoseOnUntrackedClockThrows) {
  ClockFixture f;
  EXPECT_THROW(f.clocks.Rose(f.clk_b), SchedulerError);
}

TEST(ClockTracker, TrackingMainClockThrows) {
  ClockFixture f;
  EXPECT_THROW(f.clocks.Track(f.circuit.Clock()), SchedulerError);
  EXPECT_EQ(f.clocks.TrackedCount(), 0u);
}

// =============================================================================
// Table maintenance
// =============================================================================

TEST(ClockTracker, RetainDropsUnreferencedClocks) {
  ClockFixture f;
  f.clocks.Track(f.clk_b);
  f.clocks.Track(f.clk_c);
  EXPECT_EQ(f.clocks.TrackedCount(), 2u);

  f.clocks.Retain({f.clk_c});
  EXPECT_FALSE(f.clocks.IsTracked(f.clk_b));
  EXPECT_TRUE(f.clocks.IsTracked(f.clk_c));

  f.clocks.Retain({});
  EXPECT_EQ(f.clocks.TrackedCount(), 0u);
}

TEST(ClockTracker, EdgeCountSurvivesRetain) {
  ClockFixture f;
  f.clocks.Track(f.clk_b);
  f.clocks.CountEdge(f.clk_b);
  f.clocks.CountEdge(f.clk_b);
  f.clocks.Retain({});
  EXPECT_EQ(f.clocks.Cycles(f.clk_b), 2u);
  EXPECT_EQ(f.clocks.Cycles(f.clk_c), 0u);
}
