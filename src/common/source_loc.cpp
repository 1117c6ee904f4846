#include "common/source_loc.h"

#include <string>

namespace tandem {

std::string FormatLoc(SourceLoc loc) {
  if (!loc.IsValid()) {
    return "<unknown location>";
  }
  std::string out = loc.file.empty() ? "<unknown>" : std::string(loc.file);
  out += ":" + std::to_string(loc.line);
  if (loc.column > 0) {
    out += ":" + std::to_string(loc.column);
  }
  return out;
}

}  // namespace tandem
