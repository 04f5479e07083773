#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "config/settings_store.hpp"
#include "schema/schema_cache.hpp"
#include <future>
#include <thread>

using json = nlohmann::json;
using mcpguard::core::ToolDescriptor;
using mcpguard::schema::SchemaCache;
using mcpguard::schema::SchemaCacheEntry;

namespace {

std::vector<ToolDescriptor> sample_tools() {
    ToolDescriptor search;
    search.name = "search";
    search.description = "Search issues";
    search.input_schema = {
        {"type", "object"},
        {"properties", {{"query", {{"type", "string"}}}}},
        {"required", {"query"}}
    };
    ToolDescriptor list;
    list.name = "list_repos";
    return {search, list};
}

} // anonymous namespace

void register_schema_cache_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;

    tests.push_back({"schema_cache_put_then_get", [] {
        auto store = mcpguard::config::SettingsStore::in_memory();
        SchemaCache cache(*store);
        auto entry = SchemaCacheEntry::make("github", "abc123", sample_tools());
        require(cache.put(entry), "put persisted");

        auto hit = cache.get("github", "abc123");
        require(hit.has_value(), "hit");
        require(*hit == entry, "equal entry returned");
        require(hit->tool_names.count("search") == 1, "tool names derived");
        require(!cache.get("github", "other").has_value(), "other hash misses");
        require(!cache.get("gitlab", "abc123").has_value(), "other server misses");
    }});

    tests.push_back({"schema_cache_invalidate_drops_every_hash", [] {
        auto store = mcpguard::config::SettingsStore::in_memory();
        SchemaCache cache(*store);
        cache.put(SchemaCacheEntry::make("github", "h1", sample_tools()));
        cache.put(SchemaCacheEntry::make("github", "h2", sample_tools()));
        cache.put(SchemaCacheEntry::make("slack", "h1", sample_tools()));

        require(cache.invalidate("github") == 2, "both github entries removed");
        require(!cache.get("github", "h1").has_value(), "h1 misses");
        require(!cache.get("github", "h2").has_value(), "h2 misses");
        require(cache.get("slack", "h1").has_value(), "other server untouched");
        require(cache.invalidate("github") == 0, "second invalidate is a no-op");
    }});

    tests.push_back({"schema_cache_config_change_invalidates", [] {
        auto store = mcpguard::config::SettingsStore::in_memory();
        SchemaCache cache(*store);
        cache.put(SchemaCacheEntry::make("github", "h1", sample_tools()));
        cache.on_server_config_changed("github");
        require(cache.size() == 0, "entry removed on change");
        cache.put(SchemaCacheEntry::make("github", "h2", sample_tools()));
        cache.on_server_removed("github");
        require(cache.size() == 0, "entry removed on delete");
    }});

    tests.push_back({"schema_cache_persists_in_settings_section", [] {
        mcpguard::tests::TempDir dir;
        auto path = (dir / "settings.json").string();
        auto entry = SchemaCacheEntry::make("github", "abc", sample_tools());
        {
            auto store = mcpguard::config::SettingsStore::open_file(path);
            SchemaCache cache(*store);
            require(cache.put(entry), "put");
        }

        json doc = json::parse(mcpguard::tests::read_text(path));
        require(doc["mcpSchemaCache"].contains("github:abc"), "keyed by name:hash");
        require(doc["mcpSchemaCache"]["github:abc"]["toolCount"] == 2, "tool count written");

        auto store = mcpguard::config::SettingsStore::open_file(path);
        SchemaCache reloaded(*store);
        auto hit = reloaded.get("github", "abc");
        require(hit.has_value(), "survives restart");
        require(*hit == entry, "identical after reload");
    }});

    tests.push_back({"schema_cache_skips_malformed_entries", [] {
        auto store = mcpguard::config::SettingsStore::in_memory({
            {"mcpSchemaCache", {
                {"bad:1", {{"mcpName", "bad"}}},
                {"good:1", SchemaCacheEntry::make("good", "1", sample_tools()).to_json()}
            }}
        });
        SchemaCache cache(*store);
        require(cache.size() == 1, "only the valid entry loaded");
        require(cache.get("good", "1").has_value(), "valid entry usable");
    }});

    tests.push_back({"schema_cache_concurrent_readers_and_writers", [] {
        auto store = mcpguard::config::SettingsStore::in_memory();
        SchemaCache cache(*store);
        std::vector<std::future<void>> jobs;
        for (int i = 0; i < 4; ++i) {
            jobs.push_back(std::async(std::launch::async, [&cache, i]() {
                for (int j = 0; j < 25; ++j) {
                    std::string name = "server" + std::to_string(i);
                    cache.put(SchemaCacheEntry::make(name, std::to_string(j), sample_tools()));
                    cache.get(name, std::to_string(j));
                    if (j % 5 == 0) cache.invalidate(name);
                }
            }));
        }
        for (auto& job : jobs) job.get();

        json section = store->section("mcpSchemaCache");
        require(section.is_object(), "section persisted");
        require(section.size() == cache.size(), "persisted snapshot matches memory");
    }});
}
