#include "schema/schema_cache.hpp"
#include "config/settings_store.hpp"
#include <spdlog/spdlog.h>

namespace mcpguard::schema {

using json = nlohmann::json;

// ============================================================================
// SchemaCacheEntry
// ============================================================================

json SchemaCacheEntry::to_json() const {
    json j;
    j["mcpName"] = mcp_name;
    j["configHash"] = config_hash;
    j["tools"] = json::array();
    for (const auto& tool : tools) {
        j["tools"].push_back(tool.to_json());
    }
    j["toolNames"] = json::array();
    for (const auto& name : tool_names) {
        j["toolNames"].push_back(name);
    }
    j["toolCount"] = tools.size();
    j["cachedAt"] = core::format_timestamp(cached_at);
    return j;
}

std::optional<SchemaCacheEntry> SchemaCacheEntry::from_json(const json& j) {
    if (!j.is_object() ||
        !j.contains("mcpName") || !j["mcpName"].is_string() ||
        !j.contains("configHash") || !j["configHash"].is_string() ||
        !j.contains("tools") || !j["tools"].is_array()) {
        return std::nullopt;
    }

    SchemaCacheEntry entry;
    entry.mcp_name = j["mcpName"].get<std::string>();
    entry.config_hash = j["configHash"].get<std::string>();

    for (const auto& item : j["tools"]) {
        auto tool = core::ToolDescriptor::from_json(item);
        if (!tool) {
            return std::nullopt;
        }
        entry.tool_names.insert(tool->name);
        entry.tools.push_back(std::move(*tool));
    }

    entry.cached_at = std::chrono::system_clock::now();
    if (j.contains("cachedAt") && j["cachedAt"].is_string()) {
        if (auto ts = core::parse_timestamp(j["cachedAt"].get<std::string>())) {
            entry.cached_at = *ts;
        }
    }
    return entry;
}

SchemaCacheEntry SchemaCacheEntry::make(std::string mcp_name, std::string config_hash,
                                        std::vector<core::ToolDescriptor> tools) {
    SchemaCacheEntry entry;
    entry.mcp_name = std::move(mcp_name);
    entry.config_hash = std::move(config_hash);
    entry.tools = std::move(tools);
    for (const auto& tool : entry.tools) {
        entry.tool_names.insert(tool.name);
    }
    entry.cached_at = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return entry;
}

bool SchemaCacheEntry::operator==(const SchemaCacheEntry& other) const {
    return mcp_name == other.mcp_name && config_hash == other.config_hash &&
           tools == other.tools && tool_names == other.tool_names &&
           cached_at == other.cached_at;
}

// ============================================================================
// SchemaCache
// ============================================================================

SchemaCache::SchemaCache(config::SettingsStore& settings)
    : settings_(settings) {}

std::string SchemaCache::make_key(const std::string& mcp_name, const std::string& config_hash) {
    return mcp_name + ":" + config_hash;
}

void SchemaCache::ensure_loaded() const {
    std::call_once(load_once_, [this]() {
        json section = settings_.section(config::SECTION_SCHEMA_CACHE);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!section.is_object()) {
            return;
        }
        size_t skipped = 0;
        for (auto it = section.begin(); it != section.end(); ++it) {
            auto entry = SchemaCacheEntry::from_json(it.value());
            if (!entry) {
                skipped++;
                continue;
            }
            entries_[make_key(entry->mcp_name, entry->config_hash)] = std::move(*entry);
        }
        if (skipped > 0) {
            spdlog::warn("Schema cache: skipped {} malformed entries", skipped);
        }
        spdlog::debug("Schema cache loaded {} entries", entries_.size());
    });
}

std::optional<SchemaCacheEntry> SchemaCache::get(const std::string& mcp_name,
                                                 const std::string& config_hash) const {
    ensure_loaded();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(make_key(mcp_name, config_hash));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SchemaCache::put(SchemaCacheEntry entry) {
    ensure_loaded();
    std::string key = make_key(entry.mcp_name, entry.config_hash);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (entry.tool_names.empty()) {
            for (const auto& tool : entry.tools) {
                entry.tool_names.insert(tool.name);
            }
        }
        entries_[key] = std::move(entry);
    }
    spdlog::debug("Schema cache put {}", key);
    return persist();
}

size_t SchemaCache::invalidate(const std::string& mcp_name) {
    ensure_loaded();
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.mcp_name == mcp_name) {
                it = entries_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        spdlog::info("Schema cache invalidated {} entries for {}", removed, mcp_name);
        persist();
    }
    return removed;
}

void SchemaCache::clear() {
    ensure_loaded();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
    }
    spdlog::info("Schema cache cleared");
    persist();
}

void SchemaCache::on_server_config_changed(const std::string& mcp_name) {
    invalidate(mcp_name);
}

void SchemaCache::on_server_removed(const std::string& mcp_name) {
    invalidate(mcp_name);
}

size_t SchemaCache::size() const {
    ensure_loaded();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> SchemaCache::keys() const {
    ensure_loaded();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [key, _] : entries_) {
        out.push_back(key);
    }
    return out;
}

bool SchemaCache::persist() {
    std::lock_guard<std::mutex> persist_lock(persist_mutex_);

    json section = json::object();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            section[key] = entry.to_json();
        }
    }

    if (!settings_.update_section(config::SECTION_SCHEMA_CACHE, section)) {
        spdlog::warn("Schema cache change kept in memory only");
        return false;
    }
    return true;
}

} // namespace mcpguard::schema
