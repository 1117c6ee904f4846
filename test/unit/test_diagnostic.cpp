#include <gtest/gtest.h>

#include <cstdint>
#include <source_location>

#include "common/diagnostic.h"
#include "common/source_loc.h"
#include "tester/test_env.h"

using namespace tandem;

// =============================================================================
// SourceLoc
// =============================================================================

TEST(SourceLoc, DefaultIsUnknown) {
  SourceLoc loc;
  EXPECT_FALSE(loc.IsValid());
  EXPECT_EQ(FormatLoc(loc), "<unknown location>");
}

TEST(SourceLoc, FormatsFileLineColumn) {
  SourceLoc loc{"tb.cpp", "Body", 12, 5};
  EXPECT_EQ(FormatLoc(loc), "tb.cpp:12:5");
  loc.column = 0;
  EXPECT_EQ(FormatLoc(loc), "tb.cpp:12");
}

TEST(SourceLoc, CapturesCallSite) {
  auto loc = SourceLoc::From(std::source_location::current());
  EXPECT_TRUE(loc.IsValid());
  EXPECT_NE(loc.file.find("test_diagnostic.cpp"), std::string_view::npos);
}

// =============================================================================
// DiagEngine
// =============================================================================

TEST(Diagnostic, CountsBySeverity) {
  DiagEngine diag;
  diag.SetEcho(false);
  diag.Note({}, "n");
  diag.Warning({}, "w");
  diag.Error({}, "e");
  diag.Fatal({}, "f");

  EXPECT_EQ(diag.WarningCount(), 1u);
  EXPECT_EQ(diag.ErrorCount(), 2u);
  EXPECT_TRUE(diag.HasErrors());
  EXPECT_EQ(diag.Diagnostics().size(), 4u);
}

TEST(Diagnostic, WarningsAsErrors) {
  DiagEngine diag;
  diag.SetEcho(false);
  diag.SetWarningsAsErrors(true);
  diag.Warning({}, "w");
  EXPECT_EQ(diag.WarningCount(), 0u);
  EXPECT_EQ(diag.ErrorCount(), 1u);
  EXPECT_EQ(diag.Diagnostics()[0].severity, DiagSeverity::kError);
}

TEST(Diagnostic, CountsByKind) {
  DiagEngine diag;
  diag.SetEcho(false);
  Diagnostic d;
  d.kind = DiagKind::kConflict;
  d.message = "c";
  diag.Report(d);
  diag.Report(d);
  diag.Error({}, "plain");

  EXPECT_EQ(diag.Count(DiagKind::kConflict), 2u);
  EXPECT_EQ(diag.Count(DiagKind::kGeneral), 1u);
  EXPECT_EQ(diag.Count(DiagKind::kDeadlock), 0u);
}

TEST(Diagnostic, StampsCurrentTimestep) {
  DiagEngine diag;
  diag.SetEcho(false);
  diag.Error({}, "early");
  diag.SetTimestep(7);
  diag.Error({}, "late");
  EXPECT_EQ(diag.Diagnostics()[0].timestep, 0u);
  EXPECT_EQ(diag.Diagnostics()[1].timestep, 7u);
}

TEST(Diagnostic, KeepsRelatedLocations) {
  DiagEngine diag;
  diag.SetEcho(false);
  Diagnostic d;
  d.loc = SourceLoc{"a.cpp", "", 1, 1};
  d.related.push_back(SourceLoc{"b.cpp", "", 2, 1});
  diag.Report(d);
  ASSERT_EQ(diag.Diagnostics()[0].related.size(), 1u);
  EXPECT_EQ(diag.Diagnostics()[0].related[0].file, "b.cpp");
}

// =============================================================================
// TestEnv
// =============================================================================

TEST(TestEnv, ExpectMatchRecordsNothing) {
  TestEnv env;
  env.Diag().SetEcho(false);
  EXPECT_TRUE(env.Expect(3, 3, "out", "", {}));
  EXPECT_EQ(env.ExpectCount(), 1u);
  EXPECT_EQ(env.MismatchCount(), 0u);
  EXPECT_TRUE(env.Passed());
}

TEST(TestEnv, ExpectMismatchIsDiagnostic) {
  TestEnv env;
  env.Diag().SetEcho(false);
  EXPECT_FALSE(env.Expect(3, 2, "out", "after reset", {}));
  EXPECT_EQ(env.MismatchCount(), 1u);
  EXPECT_FALSE(env.Passed());
  ASSERT_EQ(env.Diag().Diagnostics().size(), 1u);
  const auto& d = env.Diag().Diagnostics()[0];
  EXPECT_EQ(d.kind, DiagKind::kAssertionMismatch);
  EXPECT_EQ(d.message, "'out' = 2, expected 3: after reset");
}

TEST(TestEnv, CheckpointWithoutHookIsNoOp) {
  TestEnv env;
  EXPECT_NO_THROW(env.Checkpoint(0));
  uint64_t seen = 99;
  env.SetCheckpoint([&](uint64_t t) { seen = t; });
  env.Checkpoint(4);
  EXPECT_EQ(seen, 4u);
}
