/**
 * mcpguard build and runtime diagnostics
 *
 * Turns build-toolchain output into a BuildError with a location, and maps
 * runtime stack traces from artifact coordinates back to script lines.
 */
#pragma once
#include <string>
#include <optional>
#include "core/types.hpp"
#include "runtime/artifact.hpp"

namespace mcpguard::runtime {

struct Diagnostic {
    std::string file;
    std::optional<int> line;
    std::optional<int> column;
    std::string message;
};

// Recognizes `file:line:col: [error:] message` and the node form:
//   file:line
//   <source line>
//   <spaces>^^^
//   SyntaxError: message
std::optional<Diagnostic> parse_diagnostic(const std::string& output);

// Always yields a BUILD_ERROR; location mapped to "script" when it falls
// inside the script body
core::ExecutionError build_error_from_output(const std::string& stderr_text,
                                             const std::string& stdout_text,
                                             int exit_code,
                                             const Artifact& artifact);

// RUNTIME_ERROR from a runtime error frame; the first artifact.js frame of
// the stack that lies in the script body supplies the location
core::ExecutionError runtime_error_from_frame(const std::string& name,
                                              const std::string& message,
                                              const std::string& stack,
                                              const Artifact& artifact);

// Last non-empty line, for failures without an error frame
std::string last_line(const std::string& text);

} // namespace mcpguard::runtime
