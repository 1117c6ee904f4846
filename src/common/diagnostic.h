#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/source_loc.h"

namespace tandem {

enum class DiagSeverity : uint8_t {
  kNote,
  kWarning,
  kError,
  kFatal,
};

// What a diagnostic reports. Lets callers count failures by category.
enum class DiagKind : uint8_t {
  kGeneral,
  kConflict,
  kAssertionMismatch,
  kStaleRead,
  kDeadlock,
  kUserException,
};

struct Diagnostic {
  DiagSeverity severity = DiagSeverity::kError;
  DiagKind kind = DiagKind::kGeneral;
  SourceLoc loc;
  std::string message;
  uint64_t timestep = 0;
  // Other call sites involved, e.g. the second issuer of a conflict.
  std::vector<SourceLoc> related;
};

class DiagEngine {
 public:
  DiagEngine() = default;

  void Note(SourceLoc loc, std::string msg);
  void Warning(SourceLoc loc, std::string msg);
  void Error(SourceLoc loc, std::string msg);
  void Fatal(SourceLoc loc, std::string msg);

  // Structured entry point used by the scheduler and threading checker.
  void Report(Diagnostic diag);

  uint32_t ErrorCount() const { return error_count_; }
  uint32_t WarningCount() const { return warning_count_; }
  bool HasErrors() const { return error_count_ > 0; }
  uint32_t Count(DiagKind kind) const;

  const std::vector<Diagnostic>& Diagnostics() const { return diags_; }

  void SetWarningsAsErrors(bool val) { warnings_as_errors_ = val; }
  void SetEcho(bool val) { echo_ = val; }

  // Timestep stamped onto every diagnostic emitted from now on.
  void SetTimestep(uint64_t timestep) { timestep_ = timestep; }

 private:
  void Emit(Diagnostic diag);

  std::vector<Diagnostic> diags_;
  uint32_t error_count_ = 0;
  uint32_t warning_count_ = 0;
  uint64_t timestep_ = 0;
  bool warnings_as_errors_ = false;
  bool echo_ = true;
};

}  // namespace tandem
