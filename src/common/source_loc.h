#pragma once

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

namespace tandem {

// Call site of a poke, peek, expect or fork in test code. The strings point
// at static storage owned by std::source_location.
struct SourceLoc {
  std::string_view file;
  std::string_view function;
  uint32_t line = 0;
  uint32_t column = 0;

  bool IsValid() const { return line != 0; }

  static SourceLoc From(const std::source_location& loc) {
    return {loc.file_name(), loc.function_name(), loc.line(), loc.column()};
  }
};

std::string FormatLoc(SourceLoc loc);

}  // namespace tandem
