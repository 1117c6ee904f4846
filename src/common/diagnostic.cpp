#include "common/diagnostic.h"

#include <iostream>
#include <utility>

namespace tandem {

static const char* SeverityLabel(DiagSeverity sev) {
  switch (sev) {
    case DiagSeverity::kNote:
      return "note";
    case DiagSeverity::kWarning:
      return "warning";
    case DiagSeverity::kError:
      return "error";
    case DiagSeverity::kFatal:
      return "fatal error";
  }
  return "unknown";
}

static const char* KindLabel(DiagKind kind) {
  switch (kind) {
    case DiagKind::kGeneral:
      return "";
    case DiagKind::kConflict:
      return "[conflict] ";
    case DiagKind::kAssertionMismatch:
      return "[expect] ";
    case DiagKind::kStaleRead:
      return "[stale-read] ";
    case DiagKind::kDeadlock:
      return "[deadlock] ";
    case DiagKind::kUserException:
      return "[exception] ";
  }
  return "";
}

void DiagEngine::Note(SourceLoc loc, std::string msg) {
  Emit({DiagSeverity::kNote, DiagKind::kGeneral, loc, std::move(msg)});
}

void DiagEngine::Warning(SourceLoc loc, std::string msg) {
  Emit({DiagSeverity::kWarning, DiagKind::kGeneral, loc, std::move(msg)});
}

void DiagEngine::Error(SourceLoc loc, std::string msg) {
  Emit({DiagSeverity::kError, DiagKind::kGeneral, loc, std::move(msg)});
}

void DiagEngine::Fatal(SourceLoc loc, std::string msg) {
  Emit({DiagSeverity::kFatal, DiagKind::kGeneral, loc, std::move(msg)});
}

void DiagEngine::Report(Diagnostic diag) { Emit(std::move(diag)); }

uint32_t DiagEngine::Count(DiagKind kind) const {
  uint32_t n = 0;
  for (const auto& d : diags_) {
    if (d.kind == kind) ++n;
  }
  return n;
}

void DiagEngine::Emit(Diagnostic diag) {
  if (diag.severity == DiagSeverity::kWarning && warnings_as_errors_) {
    diag.severity = DiagSeverity::kError;
  }
  if (diag.severity == DiagSeverity::kError ||
      diag.severity == DiagSeverity::kFatal) {
    ++error_count_;
  } else if (diag.severity == DiagSeverity::kWarning) {
    ++warning_count_;
  }
  diag.timestep = timestep_;

  if (echo_) {
    std::cerr << FormatLoc(diag.loc) << ": " << SeverityLabel(diag.severity)
              << ": " << KindLabel(diag.kind) << diag.message << " (timestep "
              << diag.timestep << ")\n";
    for (const auto& rel : diag.related) {
      std::cerr << "  " << FormatLoc(rel) << ": note: related access here\n";
    }
  }

  diags_.push_back(std::move(diag));
}

}  // namespace tandem
