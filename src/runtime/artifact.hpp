/**
 * mcpguard artifact generation
 *
 * Wraps a validated script in the harness that becomes the runtime's
 * entry point. The harness talks to the ToolBridge over fd 3 and hands
 * the script only its capabilities: mcp, input, files, fetch. Host
 * globals (require, process, globalThis, ...) are shadowed by parameters
 * of the function the script body runs in.
 *
 * Script line L is artifact line L + line_offset.
 */
#pragma once
#include <string>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "util/scratch_workspace.hpp"

namespace mcpguard::runtime {

constexpr const char* ARTIFACT_FILE = "artifact.js";
constexpr const char* MANIFEST_FILE = "manifest.json";

struct Artifact {
    std::string source;
    int line_offset = 0;
    int script_lines = 0;

    // 0 when the artifact line lies in the harness
    int to_script_line(int artifact_line) const;
};

// Pure text assembly
Artifact assemble_artifact(const std::string& script_source,
                           const nlohmann::json& input_args,
                           const std::set<std::string>& tool_names);

struct WrittenArtifact {
    Artifact artifact;
    std::string artifact_path;
    std::string manifest_path;
};

// Writes artifact.js and manifest.json into the workspace
std::optional<WrittenArtifact> write_artifact(const util::ScratchWorkspace& workspace,
                                              const std::string& execution_id,
                                              const core::IsolationPolicy& policy,
                                              const std::string& script_source,
                                              const nlohmann::json& input_args,
                                              const std::set<std::string>& tool_names,
                                              std::string* error);

} // namespace mcpguard::runtime
