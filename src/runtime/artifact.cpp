#include "runtime/artifact.hpp"
#include "util/hash.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace mcpguard::runtime {

using json = nlohmann::json;

namespace {

// Everything before the script body. Ends with the line that opens the
// script's function, so the body starts on a fresh line.
constexpr const char* HARNESS_PROLOGUE = R"JS('use strict';
const __mcpguard = (() => {
  const fs = require('fs');
  const FD = 3;
  let pending = Buffer.alloc(0);
  let nextId = 1;

  function send(frame) {
    const data = Buffer.from(JSON.stringify(frame) + '\n', 'utf8');
    let off = 0;
    while (off < data.length) {
      try {
        off += fs.writeSync(FD, data, off, data.length - off);
      } catch (e) {
        if (e.code !== 'EAGAIN' && e.code !== 'EINTR') throw e;
      }
    }
  }

  function recvLine() {
    const chunk = Buffer.alloc(65536);
    for (;;) {
      const nl = pending.indexOf(10);
      if (nl >= 0) {
        const line = pending.subarray(0, nl).toString('utf8');
        pending = pending.subarray(nl + 1);
        return line;
      }
      let n;
      try {
        n = fs.readSync(FD, chunk, 0, chunk.length, null);
      } catch (e) {
        if (e.code === 'EAGAIN' || e.code === 'EINTR') continue;
        throw e;
      }
      if (n === 0) throw new Error('bridge channel closed');
      pending = Buffer.concat([pending, chunk.subarray(0, n)]);
    }
  }

  function request(frame) {
    const id = nextId++;
    frame.id = id;
    send(frame);
    for (;;) {
      const reply = JSON.parse(recvLine());
      if (reply.id === id) return reply;
    }
  }

  function unwrap(reply) {
    if (reply.ok) return reply.value;
    return { isError: true, error: reply.error };
  }

  const toolNames = Object.freeze(@TOOL_NAMES@);
  const callTool = async (name, args) =>
    unwrap(request({ op: 'call', tool: String(name), args: args === undefined ? {} : args }));

  const mcp = new Proxy(Object.create(null), {
    get(_target, prop) {
      if (prop === 'then' || typeof prop === 'symbol') return undefined;
      if (prop === 'callTool') return callTool;
      if (prop === 'tools') return toolNames;
      return (args) => callTool(prop, args);
    },
    set() { return false; },
    defineProperty() { return false; },
  });

  const files = Object.freeze({
    read: async (path) => unwrap(request({ op: 'read', path: String(path) })),
    write: async (path, content) =>
      unwrap(request({ op: 'write', path: String(path), content: String(content) })),
  });

  const fetchCapability = async (url, init) =>
    unwrap(request({ op: 'fetch', url: String(url), init: init === undefined ? {} : init }));

  let finished = false;
  function finish(frame, code) {
    if (finished) return;
    finished = true;
    try {
      send(frame);
    } catch (e) {
      code = 1;
    }
    process.exit(code);
  }

  function fail(err) {
    const isObj = err !== null && typeof err === 'object';
    finish({
      op: 'error',
      name: isObj && err.name ? String(err.name) : 'Error',
      message: isObj && 'message' in err ? String(err.message) : String(err),
      stack: isObj && err.stack ? String(err.stack) : '',
    }, 1);
  }

  function succeed(value) {
    let frame;
    try {
      frame = JSON.parse(JSON.stringify({ op: 'result', value: value === undefined ? null : value }));
    } catch (e) {
      fail(new TypeError('script result is not JSON-serializable: ' + e.message));
      return;
    }
    finish(frame, 0);
  }

  process.on('uncaughtException', fail);
  process.on('unhandledRejection', fail);

  return { mcp, files, fetch: fetchCapability, input: Object.freeze(@INPUT_ARGS@), succeed, fail };
})();

async function __mcpguardMain(mcp, input, files, fetch, require, process, module, exports, globalThis, global, __dirname, __filename, Buffer, WebAssembly, Deno, Bun, Function, setImmediate, queueMicrotask) {
)JS";

constexpr const char* HARNESS_EPILOGUE = R"JS(
}

__mcpguardMain(__mcpguard.mcp, __mcpguard.input, __mcpguard.files, __mcpguard.fetch)
  .then(__mcpguard.succeed, __mcpguard.fail);
)JS";

void replace_all(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

int count_lines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    int lines = static_cast<int>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') {
        lines++;
    }
    return lines;
}

} // anonymous namespace

int Artifact::to_script_line(int artifact_line) const {
    int line = artifact_line - line_offset;
    if (line < 1 || line > script_lines) {
        return 0;
    }
    return line;
}

Artifact assemble_artifact(const std::string& script_source,
                           const json& input_args,
                           const std::set<std::string>& tool_names) {
    // ensure_ascii keeps U+2028/U+2029 out of the JS source
    std::string prologue = HARNESS_PROLOGUE;
    json names = json::array();
    for (const auto& name : tool_names) {
        names.push_back(name);
    }
    replace_all(prologue, "@TOOL_NAMES@", names.dump(-1, ' ', true));
    replace_all(prologue, "@INPUT_ARGS@",
                (input_args.is_null() ? json::object() : input_args).dump(-1, ' ', true));

    Artifact artifact;
    artifact.line_offset = static_cast<int>(std::count(prologue.begin(), prologue.end(), '\n'));
    artifact.script_lines = count_lines(script_source);
    artifact.source = prologue + script_source + HARNESS_EPILOGUE;
    return artifact;
}

std::optional<WrittenArtifact> write_artifact(const util::ScratchWorkspace& workspace,
                                              const std::string& execution_id,
                                              const core::IsolationPolicy& policy,
                                              const std::string& script_source,
                                              const json& input_args,
                                              const std::set<std::string>& tool_names,
                                              std::string* error) {
    WrittenArtifact out;
    out.artifact = assemble_artifact(script_source, input_args, tool_names);
    out.artifact_path = workspace.file(ARTIFACT_FILE);
    out.manifest_path = workspace.file(MANIFEST_FILE);

    if (!workspace.write_file(ARTIFACT_FILE, out.artifact.source)) {
        if (error) *error = "cannot write " + out.artifact_path;
        return std::nullopt;
    }

    json manifest;
    manifest["executionId"] = execution_id;
    manifest["mcpName"] = policy.mcp_name;
    manifest["artifact"] = ARTIFACT_FILE;
    manifest["lineOffset"] = out.artifact.line_offset;
    manifest["scriptLines"] = out.artifact.script_lines;
    if (auto digest = util::sha256_hex(script_source)) {
        manifest["scriptSha256"] = *digest;
    }
    manifest["toolNames"] = tool_names;
    manifest["limits"] = {
        {"cpuMs", policy.limits.cpu_ms},
        {"memoryMB", policy.limits.memory_mb},
        {"maxToolCalls", policy.limits.max_tool_calls}
    };
    manifest["createdAt"] = core::format_timestamp(std::chrono::system_clock::now());

    if (!workspace.write_file(MANIFEST_FILE, manifest.dump(2))) {
        if (error) *error = "cannot write " + out.manifest_path;
        return std::nullopt;
    }

    spdlog::debug("[{}] artifact written to {} (line offset {})",
                  execution_id, out.artifact_path, out.artifact.line_offset);
    return out;
}

} // namespace mcpguard::runtime
