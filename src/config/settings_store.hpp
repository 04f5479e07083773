/**
 * mcpguard SettingsStore
 *
 * Process-wide JSON settings document shared with the IDE extension.
 * Loaded lazily on first access and written back one section at a time;
 * sections this process does not own are preserved verbatim.
 */
#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace mcpguard::config {

constexpr const char* SECTION_SCHEMA_CACHE = "mcpSchemaCache";
constexpr const char* SECTION_MCP_CONFIGS = "mcpConfigs";
constexpr const char* SECTION_DEFAULTS = "defaults";
constexpr const char* SECTION_ENABLED = "enabled";

class SettingsBackend {
public:
    virtual ~SettingsBackend() = default;

    // nullopt when the stored document is unreadable
    virtual std::optional<nlohmann::json> load() = 0;
    virtual bool save(const nlohmann::json& document) = 0;

    // True when the stored document changed since the last load()
    virtual bool stale() const { return false; }

    virtual std::string describe() const = 0;
};

// JSON file, written via temp file + rename
class FileSettingsBackend : public SettingsBackend {
public:
    explicit FileSettingsBackend(std::string path);

    std::optional<nlohmann::json> load() override;
    bool save(const nlohmann::json& document) override;
    bool stale() const override;
    std::string describe() const override { return path_; }

private:
    std::string path_;
    std::optional<std::filesystem::file_time_type> loaded_mtime_;
};

class MemorySettingsBackend : public SettingsBackend {
public:
    explicit MemorySettingsBackend(nlohmann::json initial = nlohmann::json::object());

    std::optional<nlohmann::json> load() override;
    bool save(const nlohmann::json& document) override;
    std::string describe() const override { return "memory"; }

    nlohmann::json stored() const;
    int save_count() const;

private:
    mutable std::mutex mutex_;
    nlohmann::json document_;
    int save_count_ = 0;
};

class SettingsStore {
public:
    explicit SettingsStore(std::unique_ptr<SettingsBackend> backend);

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    static std::unique_ptr<SettingsStore> open_file(const std::string& path);
    static std::unique_ptr<SettingsStore> in_memory(nlohmann::json initial = nlohmann::json::object());

    nlohmann::json snapshot() const;

    // null when absent
    nlohmann::json section(const std::string& key) const;

    // Re-reads the backing document first so concurrent external edits to
    // other sections survive, then persists
    bool update_section(const std::string& key, const nlohmann::json& value);

    bool reload();
    bool writable() const;
    std::string describe() const { return backend_->describe(); }

private:
    void ensure_fresh() const;
    bool load_locked() const;

    std::unique_ptr<SettingsBackend> backend_;
    mutable std::mutex mutex_;
    mutable bool loaded_ = false;
    // Cleared when the stored document is corrupt so it is never overwritten
    mutable bool writable_ = true;
    mutable nlohmann::json document_ = nlohmann::json::object();
};

} // namespace mcpguard::config
