#include "config/settings_store.hpp"
#include <spdlog/spdlog.h>

#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mcpguard::config {

using json = nlohmann::json;

// ============================================================================
// FileSettingsBackend
// ============================================================================

FileSettingsBackend::FileSettingsBackend(std::string path)
    : path_(std::move(path)) {}

std::optional<json> FileSettingsBackend::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        loaded_mtime_.reset();
        return json::object();
    }

    std::ifstream ifs(path_);
    if (!ifs.is_open()) {
        spdlog::warn("Cannot open settings file {}", path_);
        return std::nullopt;
    }

    auto mtime = fs::last_write_time(path_, ec);
    try {
        json doc = json::parse(ifs);
        if (!doc.is_object()) {
            spdlog::warn("Settings file {} is not a JSON object", path_);
            return std::nullopt;
        }
        if (!ec) {
            loaded_mtime_ = mtime;
        }
        return doc;
    } catch (const json::parse_error& e) {
        spdlog::warn("Settings file {} is not valid JSON: {}", path_, e.what());
        return std::nullopt;
    }
}

bool FileSettingsBackend::save(const json& document) {
    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create settings directory {}: {}",
                          target.parent_path().string(), ec.message());
            return false;
        }
    }

    std::string tmp = path_ + ".tmp." + std::to_string(getpid());
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::error("Cannot write settings temp file {}", tmp);
            return false;
        }
        ofs << document.dump(2) << "\n";
        ofs.flush();
        if (!ofs.good()) {
            spdlog::error("Short write to settings temp file {}", tmp);
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("Cannot replace settings file {}: {}", path_, ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }

    auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        loaded_mtime_ = mtime;
    }
    return true;
}

bool FileSettingsBackend::stale() const {
    std::error_code ec;
    auto mtime = fs::last_write_time(path_, ec);
    if (ec) {
        // Missing now; stale only if we had loaded something
        return loaded_mtime_.has_value();
    }
    return !loaded_mtime_ || *loaded_mtime_ != mtime;
}

// ============================================================================
// MemorySettingsBackend
// ============================================================================

MemorySettingsBackend::MemorySettingsBackend(json initial)
    : document_(std::move(initial)) {}

std::optional<json> MemorySettingsBackend::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_;
}

bool MemorySettingsBackend::save(const json& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    document_ = document;
    save_count_++;
    return true;
}

json MemorySettingsBackend::stored() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_;
}

int MemorySettingsBackend::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

// ============================================================================
// SettingsStore
// ============================================================================

SettingsStore::SettingsStore(std::unique_ptr<SettingsBackend> backend)
    : backend_(std::move(backend)) {}

std::unique_ptr<SettingsStore> SettingsStore::open_file(const std::string& path) {
    return std::make_unique<SettingsStore>(std::make_unique<FileSettingsBackend>(path));
}

std::unique_ptr<SettingsStore> SettingsStore::in_memory(json initial) {
    return std::make_unique<SettingsStore>(
        std::make_unique<MemorySettingsBackend>(std::move(initial)));
}

bool SettingsStore::load_locked() const {
    auto doc = backend_->load();
    loaded_ = true;
    if (!doc) {
        spdlog::warn("Settings from {} unreadable; using defaults and refusing to overwrite",
                     backend_->describe());
        document_ = json::object();
        writable_ = false;
        return false;
    }
    document_ = std::move(*doc);
    writable_ = true;
    return true;
}

void SettingsStore::ensure_fresh() const {
    if (!loaded_ || backend_->stale()) {
        load_locked();
    }
}

json SettingsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_fresh();
    return document_;
}

json SettingsStore::section(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_fresh();
    auto it = document_.find(key);
    if (it == document_.end()) {
        return nullptr;
    }
    return *it;
}

bool SettingsStore::update_section(const std::string& key, const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked();

    document_[key] = value;
    if (!writable_) {
        spdlog::error("Not persisting settings section '{}': {} is unreadable",
                      key, backend_->describe());
        return false;
    }

    if (!backend_->save(document_)) {
        spdlog::error("Failed to persist settings section '{}' to {}", key, backend_->describe());
        return false;
    }
    return true;
}

bool SettingsStore::reload() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

bool SettingsStore::writable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_fresh();
    return writable_;
}

} // namespace mcpguard::config
