#include "runtime/diagnostics.hpp"
#include <fmt/format.h>

#include <regex>
#include <sstream>
#include <vector>

namespace mcpguard::runtime {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

int to_int(const std::string& digits) {
    try {
        return std::stoi(digits);
    } catch (const std::exception&) {
        return 0;
    }
}

bool is_artifact_file(const std::string& file) {
    const std::string name = ARTIFACT_FILE;
    return file.size() >= name.size() &&
           file.compare(file.size() - name.size(), name.size(), name) == 0;
}

std::optional<Diagnostic> parse_node_form(const std::vector<std::string>& lines) {
    static const std::regex header(R"(^(.+):(\d+)$)");
    static const std::regex error_line(R"(^([A-Za-z_$][\w$]*(?:Error|Exception)): (.*)$)");

    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (!std::regex_match(lines[i], m, header)) {
            continue;
        }
        Diagnostic diag;
        diag.file = m[1].str();
        diag.line = to_int(m[2].str());

        for (size_t j = i + 1; j < lines.size() && j <= i + 6; ++j) {
            size_t caret = lines[j].find('^');
            if (!diag.column && caret != std::string::npos &&
                lines[j].find_first_not_of(" \t^~") == std::string::npos) {
                diag.column = static_cast<int>(caret) + 1;
                continue;
            }
            std::smatch em;
            if (std::regex_match(lines[j], em, error_line)) {
                diag.message = em[1].str() + ": " + em[2].str();
                return diag;
            }
        }
    }
    return std::nullopt;
}

std::optional<Diagnostic> parse_gcc_form(const std::vector<std::string>& lines) {
    static const std::regex located(
        R"(^([^\s:][^:]*):(\d+):(\d+):\s*(?:(?:fatal )?error:\s*)?(.*)$)");
    for (const auto& line : lines) {
        std::smatch m;
        if (std::regex_match(line, m, located)) {
            Diagnostic diag;
            diag.file = m[1].str();
            diag.line = to_int(m[2].str());
            diag.column = to_int(m[3].str());
            diag.message = m[4].str();
            return diag;
        }
    }
    return std::nullopt;
}

std::string first_line(const std::string& text) {
    for (const auto& line : split_lines(text)) {
        if (line.find_first_not_of(" \t") != std::string::npos) {
            return line;
        }
    }
    return "";
}

} // anonymous namespace

std::string last_line(const std::string& text) {
    auto lines = split_lines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->find_first_not_of(" \t") != std::string::npos) {
            return *it;
        }
    }
    return "";
}

std::optional<Diagnostic> parse_diagnostic(const std::string& output) {
    auto lines = split_lines(output);
    if (auto diag = parse_node_form(lines)) {
        return diag;
    }
    return parse_gcc_form(lines);
}

core::ExecutionError build_error_from_output(const std::string& stderr_text,
                                             const std::string& stdout_text,
                                             int exit_code,
                                             const Artifact& artifact) {
    std::optional<Diagnostic> diag = parse_diagnostic(stderr_text);
    if (!diag) {
        diag = parse_diagnostic(stdout_text);
    }

    if (!diag) {
        std::string message = first_line(stderr_text);
        if (message.empty()) message = first_line(stdout_text);
        if (message.empty()) message = fmt::format("build toolchain exited with code {}", exit_code);
        return core::ExecutionError::make(core::ErrorKind::BUILD_ERROR, message);
    }

    auto err = core::ExecutionError::make(core::ErrorKind::BUILD_ERROR,
        diag->message.empty() ? fmt::format("build toolchain exited with code {}", exit_code)
                              : diag->message);
    err.file = diag->file;
    err.line = diag->line;
    err.column = diag->column;

    if (diag->line && is_artifact_file(diag->file)) {
        int line = *diag->line;
        if (int mapped = artifact.to_script_line(line)) {
            err.file = "script";
            err.line = mapped;
        } else if (line > artifact.line_offset && artifact.script_lines > 0) {
            // Reported past the body (e.g. unexpected end of input): blame the last line
            err.file = "script";
            err.line = artifact.script_lines;
            err.column.reset();
        } else {
            err.file = ARTIFACT_FILE;
        }
    }
    return err;
}

core::ExecutionError runtime_error_from_frame(const std::string& name,
                                              const std::string& message,
                                              const std::string& stack,
                                              const Artifact& artifact) {
    std::string text = name.empty() ? message : name + ": " + message;
    auto err = core::ExecutionError::make(core::ErrorKind::RUNTIME_ERROR, text);
    if (!stack.empty()) {
        err.stack = stack;
    }

    static const std::regex frame_re(R"(artifact\.js:(\d+):(\d+))");
    for (auto it = std::sregex_iterator(stack.begin(), stack.end(), frame_re);
         it != std::sregex_iterator(); ++it) {
        int mapped = artifact.to_script_line(to_int((*it)[1].str()));
        if (mapped) {
            err.file = "script";
            err.line = mapped;
            err.column = to_int((*it)[2].str());
            break;
        }
    }
    return err;
}

} // namespace mcpguard::runtime
