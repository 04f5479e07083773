#include "policy/capabilities.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace mcpguard::policy {

namespace {

bool has_glob(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

std::string expand_home(const std::string& pattern) {
    if (!pattern.empty() && pattern[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            return std::string(home) + pattern.substr(1);
        }
    }
    return pattern;
}

bool is_under(const std::string& path, std::string dir) {
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    if (path == dir) {
        return true;
    }
    if (dir == "/") {
        return !path.empty() && path[0] == '/';
    }
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

} // anonymous namespace

std::string CapabilityChecker::extract_host(const std::string& url) {
    std::string rest = url;

    size_t proto_end = rest.find("://");
    if (proto_end != std::string::npos) {
        rest = rest.substr(proto_end + 3);
    } else if (rest.rfind("//", 0) == 0) {
        rest = rest.substr(2);
    }

    // Authority ends at the first of / ? #
    size_t auth_end = rest.find_first_of("/?#");
    if (auth_end != std::string::npos) {
        rest = rest.substr(0, auth_end);
    }

    // Drop userinfo
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        rest = rest.substr(at + 1);
    }

    if (!rest.empty() && rest[0] == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return "";
        }
        return rest.substr(1, close - 1);
    }

    size_t port_start = rest.find(':');
    if (port_start != std::string::npos) {
        rest = rest.substr(0, port_start);
    }
    return rest;
}

std::string CapabilityChecker::normalize_host(const std::string& host) {
    std::string out = host;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool CapabilityChecker::is_loopback(const std::string& host) {
    std::string h = normalize_host(host);
    if (h == "localhost" || h == "::1" || h == "0:0:0:0:0:0:0:1") {
        return true;
    }
    if (h.size() > 10 && h.compare(h.size() - 10, 10, ".localhost") == 0) {
        return true;
    }
    // Whole 127.0.0.0/8
    return h.rfind("127.", 0) == 0 &&
           std::all_of(h.begin(), h.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == '.'; });
}

bool CapabilityChecker::host_matches(const std::string& host, const std::string& pattern) {
    std::string h = normalize_host(host);
    std::string p = normalize_host(pattern);
    if (h.empty() || p.empty()) {
        return false;
    }

    if (h == p) {
        return true;
    }

    if (p.size() > 2 && p[0] == '*' && p[1] == '.') {
        std::string base = p.substr(2);           // example.com
        std::string suffix = p.substr(1);         // .example.com
        if (h == base) {
            return true;
        }
        if (h.size() > suffix.size()) {
            return h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    }
    return false;
}

bool CapabilityChecker::path_matches(const std::string& path, const std::string& pattern) {
    std::string expanded = expand_home(pattern);
    if (expanded.empty()) {
        return false;
    }

    if (expanded.size() >= 3 && expanded.compare(expanded.size() - 3, 3, "/**") == 0) {
        std::string dir = expanded.substr(0, expanded.size() - 3);
        if (!has_glob(dir)) {
            return is_under(path, dir.empty() ? "/" : dir);
        }
    }

    if (!has_glob(expanded)) {
        return is_under(path, expanded);
    }

    return fnmatch(expanded.c_str(), path.c_str(), FNM_PATHNAME) == 0;
}

std::string CapabilityChecker::normalize_path(const std::string& path) {
    if (path.empty() || path[0] != '/') {
        return "";
    }
    try {
        // Resolves symlinks of the existing prefix so links cannot escape a grant
        return fs::weakly_canonical(fs::path(path).lexically_normal()).string();
    } catch (const fs::filesystem_error& e) {
        spdlog::debug("Cannot canonicalize {}: {}", path, e.what());
        return fs::path(path).lexically_normal().string();
    }
}

bool CapabilityChecker::can_fetch(const core::IsolationPolicy& policy, const std::string& url,
                                  std::string* reason) {
    std::string host = normalize_host(extract_host(url));
    if (host.empty()) {
        if (reason) *reason = "cannot determine host of '" + url + "'";
        return false;
    }

    if (is_loopback(host)) {
        if (policy.network.allow_localhost) {
            return true;
        }
        if (reason) *reason = "loopback access to '" + host + "' is not permitted";
        return false;
    }

    if (!policy.network.allowed_hosts) {
        if (reason) *reason = "network access is disabled for " + policy.mcp_name;
        return false;
    }

    for (const auto& allowed : *policy.network.allowed_hosts) {
        if (host_matches(host, allowed)) {
            return true;
        }
    }

    if (reason) *reason = "host '" + host + "' is not in the allowlist";
    return false;
}

bool CapabilityChecker::can_access_path(const core::IsolationPolicy& policy,
                                        const std::string& path, PathAccess access,
                                        std::string* reason) {
    const char* verb = access == PathAccess::READ ? "read" : "write";

    if (!policy.file_system.enabled) {
        if (reason) *reason = "filesystem access is disabled for " + policy.mcp_name;
        return false;
    }

    std::string normalized = normalize_path(path);
    if (normalized.empty()) {
        if (reason) *reason = "path '" + path + "' must be absolute";
        return false;
    }

    const auto& grants = access == PathAccess::READ ? policy.file_system.read_paths
                                                    : policy.file_system.write_paths;
    for (const auto& pattern : grants) {
        if (path_matches(normalized, pattern)) {
            return true;
        }
    }

    if (reason) *reason = std::string(verb) + " access to '" + normalized + "' is not granted";
    return false;
}

} // namespace mcpguard::policy
