#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "config/orchestrator_config.hpp"
#include "config/settings_store.hpp"
#include <cstdlib>
#include <optional>

using json = nlohmann::json;

namespace {

struct EnvGuard {
    std::string key;
    std::optional<std::string> old_value;

    EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
        if (const char* existing = std::getenv(key.c_str())) {
            old_value = existing;
        }
        if (value) {
            setenv(key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

    ~EnvGuard() {
        if (old_value) {
            setenv(key.c_str(), old_value->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }
};

} // anonymous namespace

void register_settings_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;
    using mcpguard::tests::TempDir;
    using mcpguard::config::SettingsStore;
    using mcpguard::config::OrchestratorConfig;

    // ========================================================================
    // SettingsStore
    // ========================================================================

    tests.push_back({"settings_missing_file_is_empty", [] {
        TempDir dir;
        auto store = SettingsStore::open_file((dir / "nested/settings.json").string());
        require(store->snapshot().is_object(), "object");
        require(store->snapshot().empty(), "empty document");
        require(store->section("defaults").is_null(), "absent section is null");
        require(store->writable(), "missing file may be created");
    }});

    tests.push_back({"settings_update_preserves_other_sections", [] {
        TempDir dir;
        auto path = dir / "settings.json";
        mcpguard::tests::write_text(path, R"({"enabled": true, "tokenMetricsCache": {"x": 1}})");

        auto store = SettingsStore::open_file(path.string());
        require(store->update_section("mcpSchemaCache", {{"a:1", {{"tools", json::array()}}}}),
                "update persisted");

        json on_disk = json::parse(mcpguard::tests::read_text(path));
        require(on_disk["tokenMetricsCache"]["x"] == 1, "unrelated section preserved");
        require(on_disk["enabled"] == true, "scalar preserved");
        require(on_disk["mcpSchemaCache"].contains("a:1"), "new section written");

        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir.path(), ec)) {
            require(entry.path().filename().string().find(".tmp.") == std::string::npos,
                    "no temp file left behind");
        }
    }});

    tests.push_back({"settings_update_rereads_external_edits", [] {
        TempDir dir;
        auto path = dir / "settings.json";
        mcpguard::tests::write_text(path, R"({"defaults": {}})");
        auto store = SettingsStore::open_file(path.string());
        require(store->section("defaults").is_object(), "initial load");

        mcpguard::tests::write_text(path, R"({"defaults": {}, "mcpConfigs": [{"mcpName": "x"}]})");
        require(store->update_section("mcpSchemaCache", json::object()), "update");

        json on_disk = json::parse(mcpguard::tests::read_text(path));
        require(on_disk["mcpConfigs"].is_array(), "external edit not clobbered");
    }});

    tests.push_back({"settings_corrupt_file_is_never_overwritten", [] {
        TempDir dir;
        auto path = dir / "settings.json";
        mcpguard::tests::write_text(path, "{ not json");
        auto store = SettingsStore::open_file(path.string());
        require(store->snapshot().empty(), "defaults used");
        require(!store->writable(), "marked read-only");
        require(!store->update_section("mcpSchemaCache", json::object()), "update refused");
        require(mcpguard::tests::read_text(path) == "{ not json", "file untouched");
    }});

    tests.push_back({"settings_memory_backend", [] {
        auto backend = std::make_unique<mcpguard::config::MemorySettingsBackend>(json{{"a", 1}});
        auto* raw = backend.get();
        SettingsStore store(std::move(backend));
        require(store.section("a") == 1, "initial document");
        require(store.update_section("b", "x"), "update");
        require(raw->save_count() == 1, "one save");
        require(raw->stored()["b"] == "x", "persisted to backend");
        require(store.describe() == "memory", "describe");
    }});

    // ========================================================================
    // OrchestratorConfig
    // ========================================================================

    tests.push_back({"config_defaults", [] {
        OrchestratorConfig config;
        require(config.build_command.front() == "node", "node build default");
        require(config.runtime_command.back() == "{artifact}", "artifact placeholder");
        require(config.max_script_bytes == 50000, "script size default");
        require(config.enable_namespaces && config.enable_cgroups, "isolation on by default");
    }});

    tests.push_back({"config_apply_json", [] {
        OrchestratorConfig config;
        std::string error;
        require(config.apply_json({
            {"socket_path", "/tmp/x.sock"},
            {"build_command", {"true"}},
            {"build_timeout_ms", 1000},
            {"timeout_grace_ms", 0},
            {"enable_cgroups", false},
            {"some_future_key", 1}
        }, &error), "apply: " + error);
        require(config.socket_path == "/tmp/x.sock", "string");
        require(config.build_command == std::vector<std::string>{"true"}, "list");
        require(config.build_timeout_ms == 1000, "int");
        require(config.timeout_grace_ms == 0, "zero grace allowed");
        require(!config.enable_cgroups, "bool");
    }});

    tests.push_back({"config_rejects_bad_values", [] {
        OrchestratorConfig config;
        std::string error;
        require(!config.apply_json({{"build_command", json::array()}}, &error), "empty argv");
        require(!error.empty(), "error message");
        require(!config.apply_json({{"build_timeout_ms", -1}}), "negative timeout");
        require(!config.apply_json({{"enable_namespaces", "yes"}}), "string bool");
        require(!config.apply_json(json::array()), "non-object");
    }});

    tests.push_back({"config_load_file_and_environment", [] {
        TempDir dir;
        auto path = dir / "orchestrator.json";
        mcpguard::tests::write_text(path, R"({"scratch_root": "/from/file", "log_level": "debug"})");

        OrchestratorConfig config;
        std::string error;
        require(config.load_file(path.string(), &error), "load: " + error);
        require(config.scratch_root == "/from/file", "file value");

        EnvGuard scratch("MCPGUARD_SCRATCH_DIR", std::string("/from/env"));
        EnvGuard level("MCPGUARD_LOG_LEVEL", std::nullopt);
        EnvGuard settings("MCPGUARD_SETTINGS", std::string("/env/settings.json"));
        config.apply_environment();
        require(config.scratch_root == "/from/env", "environment overrides file");
        require(config.log_level == "debug", "unset variable leaves file value");
        require(config.resolved_settings_path() == "/env/settings.json", "settings path");

        mcpguard::tests::write_text(path, "[");
        require(!config.load_file(path.string(), &error), "invalid JSON rejected");
        require(!config.load_file((dir / "missing.json").string()), "missing file rejected");
    }});

    tests.push_back({"config_default_settings_path_under_home", [] {
        EnvGuard home("HOME", std::string("/home/tester"));
        OrchestratorConfig config;
        require(config.resolved_settings_path() == "/home/tester/.mcpguard/settings.json",
                "default settings path");
        require(OrchestratorConfig::default_config_path() == "/home/tester/.mcpguard/orchestrator.json",
                "default config path");
    }});
}
