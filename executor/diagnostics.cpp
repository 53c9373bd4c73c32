#include "executor/diagnostics.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace executor {

std::string Diagnostic::ToString() const {
  if (!parsed) return message;
  return absl::StrCat("L", line, ":", column, ": ", message);
}

std::vector<Diagnostic> FormatDiagnostics(const std::string& raw_output) {
  std::vector<Diagnostic> diagnostics;
  absl::string_view trimmed = absl::StripAsciiWhitespace(raw_output);
  if (trimmed.empty()) return diagnostics;

  for (absl::string_view line : absl::StrSplit(trimmed, '\n')) {
    std::vector<absl::string_view> parts =
        absl::StrSplit(line, absl::MaxSplits(':', 3));
    Diagnostic diagnostic;
    if (parts.size() == 4) {
      diagnostic.parsed = true;
      diagnostic.line = std::string(parts[1]);
      diagnostic.column = std::string(parts[2]);
      diagnostic.message = std::string(absl::StripAsciiWhitespace(parts[3]));
    } else {
      diagnostic.message = std::string(line);
    }
    diagnostics.push_back(std::move(diagnostic));
  }
  return diagnostics;
}

std::string JoinDiagnostics(const std::vector<Diagnostic>& diagnostics) {
  return absl::StrJoin(diagnostics, "\n",
                       [](std::string* out, const Diagnostic& diagnostic) {
                         out->append(diagnostic.ToString());
                       });
}

}  // namespace executor
