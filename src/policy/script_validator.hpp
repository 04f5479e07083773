/**
 * mcpguard ScriptValidator
 *
 * Static pre-flight check run before any process is created. Rejects
 * scripts that reach for dynamic evaluation, host process/OS objects or
 * module loading. Capability injection in the harness is the real
 * boundary; this check fails fast with a precise location.
 */
#pragma once
#include <string>
#include <vector>
#include <regex>
#include <cstddef>

namespace mcpguard::policy {

struct BlockedPattern {
    std::string name;         // what the caller is told, e.g. "eval("
    std::string description;
    std::regex regex;
};

struct ValidationResult {
    bool ok = true;
    std::string pattern;      // BlockedPattern::name, empty for size/emptiness errors
    int line = 0;             // 1-based, 0 when not applicable
    int column = 0;
    std::string message;
};

class ScriptValidator {
public:
    explicit ScriptValidator(size_t max_script_bytes = 50000);

    ValidationResult validate(const std::string& script) const;

    size_t max_script_bytes() const { return max_script_bytes_; }

    static const std::vector<BlockedPattern>& blocked_patterns();

private:
    size_t max_script_bytes_;
};

} // namespace mcpguard::policy
