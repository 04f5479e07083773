/**
 * mcpguard ScratchWorkspace
 *
 * Per-execution temporary directory created with mkdtemp(). The directory
 * and everything under it is removed by remove() and by the destructor.
 */
#pragma once
#include <string>
#include <optional>

namespace mcpguard::util {

class ScratchWorkspace {
public:
    ~ScratchWorkspace();

    ScratchWorkspace(const ScratchWorkspace&) = delete;
    ScratchWorkspace& operator=(const ScratchWorkspace&) = delete;
    ScratchWorkspace(ScratchWorkspace&& other) noexcept;
    ScratchWorkspace& operator=(ScratchWorkspace&& other) noexcept;

    // Creates <root>/mcpguard-<label>-XXXXXX with mode 0700
    static std::optional<ScratchWorkspace> create(const std::string& root,
                                                  const std::string& label);

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

    bool write_file(const std::string& name, const std::string& contents) const;

    // Idempotent
    bool remove();
    bool exists() const;

private:
    explicit ScratchWorkspace(std::string path);

    std::string path_;
};

// Strips anything outside [A-Za-z0-9_-] so ids are safe in paths
std::string sanitize_label(const std::string& label, size_t max_len = 32);

} // namespace mcpguard::util
