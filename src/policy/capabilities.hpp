#pragma once
#include <string>
#include "core/types.hpp"

namespace mcpguard::policy {

enum class PathAccess {
    READ,
    WRITE
};

// Capability gates evaluated by the tool bridge on the script's behalf
class CapabilityChecker {
public:
    // Host part of a URL: scheme, userinfo, port, path and IPv6 brackets removed
    static std::string extract_host(const std::string& url);

    // Lowercased, trailing dot removed
    static std::string normalize_host(const std::string& host);

    static bool is_loopback(const std::string& host);

    // Supports *.example.com, which also matches example.com itself
    static bool host_matches(const std::string& host, const std::string& pattern);

    // Glob match with FNM_PATHNAME; "dir/**" and plain directories match
    // everything beneath them; a leading ~ expands to $HOME
    static bool path_matches(const std::string& path, const std::string& pattern);

    // Absolute, lexically normal, symlinks in existing prefixes resolved.
    // Empty for relative or empty input.
    static std::string normalize_path(const std::string& path);

    static bool can_fetch(const core::IsolationPolicy& policy, const std::string& url,
                          std::string* reason = nullptr);

    static bool can_access_path(const core::IsolationPolicy& policy, const std::string& path,
                                PathAccess access, std::string* reason = nullptr);
};

} // namespace mcpguard::policy
