#ifndef EXECUTOR_DIAGNOSTICS_HPP
#define EXECUTOR_DIAGNOSTICS_HPP

#include <string>
#include <vector>

namespace executor {

// One lint finding. Lines of the linter output that do not have the
// path:line:column:message shape are kept as they are in message, with
// parsed set to false.
struct Diagnostic {
  bool parsed = false;
  std::string line;
  std::string column;
  std::string message;

  // L{line}:{column}: {message}, or the original line if it was not parsed.
  std::string ToString() const;
};

// Turns the raw output of the linter into diagnostics, one per output line,
// dropping the path of the checked file.
std::vector<Diagnostic> FormatDiagnostics(const std::string& raw_output);

// Renders diagnostics one per line.
std::string JoinDiagnostics(const std::vector<Diagnostic>& diagnostics);

}  // namespace executor

#endif
