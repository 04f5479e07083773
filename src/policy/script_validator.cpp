#include "policy/script_validator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace mcpguard::policy {

namespace {

BlockedPattern make_pattern(const char* name, const char* description, const char* expr) {
    return BlockedPattern{name, description, std::regex(expr, std::regex::ECMAScript)};
}

std::vector<BlockedPattern> build_patterns() {
    std::vector<BlockedPattern> patterns;
    patterns.push_back(make_pattern("require(", "module loading via require()",
                                    R"(\brequire\s*\()"));
    patterns.push_back(make_pattern("import from", "static module import",
                                    R"(\bimport\s+[\w$*{}, \t\r\n]{0,200}from\s*['"`]|\bimport\s*['"`])"));
    patterns.push_back(make_pattern("import(", "dynamic module import",
                                    R"(\bimport\s*\()"));
    patterns.push_back(make_pattern("eval(", "dynamic code evaluation",
                                    R"(\beval\s*\()"));
    patterns.push_back(make_pattern("Function(", "Function constructor",
                                    R"(\bFunction\s*\()"));
    patterns.push_back(make_pattern("process.", "host process object",
                                    R"(\bprocess\s*(\.|\[))"));
    patterns.push_back(make_pattern("__dirname", "host module path",
                                    R"(\b__dirname\b)"));
    patterns.push_back(make_pattern("__filename", "host module path",
                                    R"(\b__filename\b)"));
    patterns.push_back(make_pattern("global.", "host global object",
                                    R"(\bglobal\s*(\.|\[))"));
    patterns.push_back(make_pattern("globalThis", "host global object",
                                    R"(\bglobalThis\b)"));
    patterns.push_back(make_pattern("child_process", "subprocess module",
                                    R"(child_process)"));
    patterns.push_back(make_pattern("Deno.", "Deno runtime object",
                                    R"(\bDeno\s*\.)"));
    patterns.push_back(make_pattern("Bun.", "Bun runtime object",
                                    R"(\bBun\s*\.)"));
    patterns.push_back(make_pattern("WebAssembly", "WebAssembly compilation",
                                    R"(\bWebAssembly\b)"));
    patterns.push_back(make_pattern(".constructor.constructor", "constructor chain escape",
                                    R"(\.\s*constructor\s*\.\s*constructor\b|\[\s*['"`]constructor['"`]\s*\]\s*\[\s*['"`]constructor['"`]\s*\])"));
    return patterns;
}

void locate(const std::string& text, size_t offset, int& line, int& column) {
    size_t line_start = 0;
    line = 1;
    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            line++;
            line_start = i + 1;
        }
    }
    column = static_cast<int>(offset - line_start) + 1;
}

} // anonymous namespace

ScriptValidator::ScriptValidator(size_t max_script_bytes)
    : max_script_bytes_(max_script_bytes) {}

const std::vector<BlockedPattern>& ScriptValidator::blocked_patterns() {
    static const std::vector<BlockedPattern> patterns = build_patterns();
    return patterns;
}

ValidationResult ScriptValidator::validate(const std::string& script) const {
    ValidationResult result;

    if (script.find_first_not_of(" \t\r\n") == std::string::npos) {
        result.ok = false;
        result.message = "script is empty";
        return result;
    }

    if (script.size() > max_script_bytes_) {
        result.ok = false;
        result.message = fmt::format("script is {} bytes, limit is {}",
                                     script.size(), max_script_bytes_);
        return result;
    }

    // Earliest offending match wins so the reported location is the first one
    size_t best_offset = std::string::npos;
    const BlockedPattern* best = nullptr;

    for (const auto& pattern : blocked_patterns()) {
        std::smatch match;
        if (std::regex_search(script, match, pattern.regex)) {
            size_t offset = static_cast<size_t>(match.position(0));
            if (offset < best_offset) {
                best_offset = offset;
                best = &pattern;
            }
        }
    }

    if (best) {
        result.ok = false;
        result.pattern = best->name;
        locate(script, best_offset, result.line, result.column);
        result.message = fmt::format("disallowed construct '{}' ({}) at line {}, column {}",
                                     best->name, best->description, result.line, result.column);
        spdlog::debug("Script rejected: {}", result.message);
    }

    return result;
}

} // namespace mcpguard::policy
