/**
 * mcpguard SchemaCache
 *
 * Tool metadata per (tool server, configuration fingerprint), persisted in
 * the settings store section "mcpSchemaCache" under "<mcpName>:<configHash>".
 * Readers share a lock; a writer holds it exclusively only for the in-memory
 * mutation, then persists a snapshot. No TTL: entries leave only through
 * invalidation or a configuration change.
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace mcpguard::config {
class SettingsStore;
}

namespace mcpguard::schema {

struct SchemaCacheEntry {
    std::string mcp_name;
    std::string config_hash;
    std::vector<core::ToolDescriptor> tools;
    std::set<std::string> tool_names;
    std::chrono::system_clock::time_point cached_at;

    nlohmann::json to_json() const;
    static std::optional<SchemaCacheEntry> from_json(const nlohmann::json& j);

    // tool_names derived from tools, cached_at = now
    static SchemaCacheEntry make(std::string mcp_name, std::string config_hash,
                                 std::vector<core::ToolDescriptor> tools);

    bool operator==(const SchemaCacheEntry& other) const;
};

class SchemaCache {
public:
    explicit SchemaCache(config::SettingsStore& settings);

    SchemaCache(const SchemaCache&) = delete;
    SchemaCache& operator=(const SchemaCache&) = delete;

    std::optional<SchemaCacheEntry> get(const std::string& mcp_name,
                                        const std::string& config_hash) const;

    // Replaces any entry under the same key; false only if persisting failed
    bool put(SchemaCacheEntry entry);

    // Removes every entry for mcp_name regardless of hash; returns count
    size_t invalidate(const std::string& mcp_name);

    void clear();

    void on_server_config_changed(const std::string& mcp_name);
    void on_server_removed(const std::string& mcp_name);

    size_t size() const;
    std::vector<std::string> keys() const;

    static std::string make_key(const std::string& mcp_name, const std::string& config_hash);

private:
    void ensure_loaded() const;
    bool persist();

    config::SettingsStore& settings_;

    mutable std::shared_mutex mutex_;
    mutable std::once_flag load_once_;
    mutable std::map<std::string, SchemaCacheEntry> entries_;

    // Serializes snapshot + write so persisted state never goes backwards
    std::mutex persist_mutex_;
};

} // namespace mcpguard::schema
