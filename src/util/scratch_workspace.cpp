#include "util/scratch_workspace.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace mcpguard::util {

ScratchWorkspace::ScratchWorkspace(std::string path)
    : path_(std::move(path)) {}

ScratchWorkspace::~ScratchWorkspace() {
    remove();
}

ScratchWorkspace::ScratchWorkspace(ScratchWorkspace&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchWorkspace& ScratchWorkspace::operator=(ScratchWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::optional<ScratchWorkspace> ScratchWorkspace::create(const std::string& root,
                                                         const std::string& label) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        spdlog::error("Cannot create scratch root {}: {}", root, ec.message());
        return std::nullopt;
    }

    std::string pattern = root + "/mcpguard-" + sanitize_label(label) + "-XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        spdlog::error("mkdtemp({}) failed: {}", pattern, strerror(errno));
        return std::nullopt;
    }
    chmod(buf.data(), 0700);

    spdlog::debug("Created scratch workspace {}", buf.data());
    return ScratchWorkspace(std::string(buf.data()));
}

bool ScratchWorkspace::write_file(const std::string& name, const std::string& contents) const {
    if (path_.empty()) {
        return false;
    }
    std::ofstream ofs(file(name), std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::error("Cannot open {} for writing", file(name));
        return false;
    }
    ofs << contents;
    ofs.flush();
    return ofs.good();
}

bool ScratchWorkspace::remove() {
    if (path_.empty()) {
        return true;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove scratch workspace {}: {}", path_, ec.message());
        return false;
    }
    spdlog::debug("Removed scratch workspace {}", path_);
    path_.clear();
    return true;
}

bool ScratchWorkspace::exists() const {
    std::error_code ec;
    return !path_.empty() && fs::exists(path_, ec);
}

std::string sanitize_label(const std::string& label, size_t max_len) {
    std::string out;
    for (char c : label) {
        if (out.size() >= max_len) break;
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        out.push_back(ok ? c : '_');
    }
    if (out.empty()) {
        out = "exec";
    }
    return out;
}

} // namespace mcpguard::util
