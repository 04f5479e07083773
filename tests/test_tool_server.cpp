#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "bridge/stdio_tool_server.hpp"
#include "bridge/tool_server.hpp"
#include <chrono>

using json = nlohmann::json;
using mcpguard::bridge::StdioToolServer;
using mcpguard::bridge::ToolServerConfig;
using mcpguard::bridge::ToolServerRegistry;

namespace {

ToolServerConfig fake_server_config(const std::filesystem::path& script) {
    ToolServerConfig config;
    config.command = "/bin/sh";
    config.args = {script.string()};
    return config;
}

} // anonymous namespace

void register_tool_server_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;
    using mcpguard::tests::TempDir;

    // ========================================================================
    // Configuration and fingerprints
    // ========================================================================

    tests.push_back({"tool_server_config_from_json", [] {
        std::string error;
        auto config = ToolServerConfig::from_json(
            {{"command", "npx"}, {"args", {"-y", "server"}}, {"env", {{"TOKEN", "secret"}}}}, &error);
        require(config.has_value(), "parsed: " + error);
        require(config->args.size() == 2, "args");
        require(config->env.at("TOKEN") == "secret", "env");

        require(!ToolServerConfig::from_json({{"args", json::array()}}, &error), "command required");
        require(!ToolServerConfig::from_json(json::array()), "non-object rejected");
    }});

    tests.push_back({"tool_server_fingerprint_tracks_config", [] {
        ToolServerConfig a;
        a.command = "npx";
        a.args = {"server"};
        ToolServerConfig b = a;
        require(mcpguard::bridge::config_fingerprint("gh", a) ==
                mcpguard::bridge::config_fingerprint("gh", b), "stable");
        require(mcpguard::bridge::config_fingerprint("gh", a).size() == 16, "16 hex chars");

        b.env["TOKEN"] = "x";
        require(mcpguard::bridge::config_fingerprint("gh", a) !=
                mcpguard::bridge::config_fingerprint("gh", b), "env change alters hash");
        require(mcpguard::bridge::config_fingerprint("gh", a) !=
                mcpguard::bridge::config_fingerprint("other", a), "name is part of hash");
    }});

    tests.push_back({"tool_server_registry_change_notifies", [] {
        ToolServerRegistry registry;
        std::vector<std::string> changed;
        registry.add_change_listener([&changed](const std::string& name) { changed.push_back(name); });

        ToolServerConfig config;
        config.command = "srv";
        registry.register_server("gh", config);
        require(changed.empty(), "first registration is not a change");
        auto first = registry.config_hash("gh");

        registry.register_server("gh", config);
        require(changed.empty(), "same config is not a change");

        config.args = {"--verbose"};
        registry.register_server("gh", config);
        require(changed.size() == 1 && changed[0] == "gh", "changed config notifies");
        require(registry.config_hash("gh") != first, "hash updated");

        require(registry.remove_server("gh"), "removed");
        require(changed.size() == 2, "removal notifies");
        require(!registry.has_server("gh"), "gone");
        require(!registry.remove_server("gh"), "second removal is a no-op");
    }});

    tests.push_back({"tool_server_registry_load_document", [] {
        ToolServerRegistry registry;
        std::string error;
        require(registry.load_document({{"mcpServers", {
            {"a", {{"command", "x"}}},
            {"b", {{"command", "y"}, {"args", {"1"}}}},
            {"broken", {{"args", json::array()}}}
        }}}, &error), "loaded: " + error);
        require(registry.server_names().size() == 2, "broken entry skipped");

        require(registry.load_document({{"mcpServers", {{"b", {{"command", "y"}, {"args", {"1"}}}}}}}),
                "reload");
        require(!registry.has_server("a"), "servers missing from document removed");
        require(registry.has_server("b"), "kept server stays");

        require(!registry.load_document({{"servers", json::object()}}, &error), "wrong shape");
    }});

    tests.push_back({"tool_server_registry_unknown_server", [] {
        ToolServerRegistry registry;
        std::string error;
        require(registry.connect("nope", &error) == nullptr, "no connection");
        require(error.find("not configured") != std::string::npos, "error message");
    }});

    // ========================================================================
    // StdioToolServer against a shell MCP server
    // ========================================================================

    tests.push_back({"stdio_tool_server_lists_and_calls", [] {
        TempDir dir;
        auto script = dir / "server.sh";
        mcpguard::tests::write_text(script, mcpguard::tests::fake_mcp_server_script());

        StdioToolServer server("fake", fake_server_config(script), 5000);
        std::string error;
        require(server.start(&error), "started: " + error);
        require(server.is_running(), "running");
        require(server.server_info()["name"] == "fake", "serverInfo captured");

        auto tools = server.list_tools(&error);
        require(tools.has_value(), "listed: " + error);
        require(tools->size() == 2, "two tools");
        require((*tools)[0].name == "echo", "first tool");
        require((*tools)[0].description && *(*tools)[0].description == "Echo text", "description");
        require((*tools)[0].input_schema["required"][0] == "text", "input schema kept");
        require(!(*tools)[1].description.has_value(), "description optional");

        auto outcome = server.call_tool("echo", {{"text", "hi"}});
        require(outcome.ok, "call ok: " + outcome.error);
        require(outcome.result["content"][0]["text"] == "echoed", "result content");

        auto failed = server.call_tool("fail", json::object());
        require(!failed.ok, "JSON-RPC error is a failed call");
        require(failed.error.find("tool exploded") != std::string::npos, "error text: " + failed.error);

        server.stop();
        require(!server.is_running(), "stopped");
    }});

    tests.push_back({"stdio_tool_server_start_failures", [] {
        std::string error;
        ToolServerConfig missing;
        missing.command = "/nonexistent/mcp-server-binary";
        StdioToolServer absent("absent", missing, 2000);
        require(!absent.start(&error), "missing binary fails");
        require(!error.empty(), "error reported");

        ToolServerConfig silent;
        silent.command = "/bin/sh";
        silent.args = {"-c", "cat >/dev/null"};
        StdioToolServer mute("mute", silent, 300);
        auto started = std::chrono::steady_clock::now();
        require(!mute.start(&error), "no handshake answer fails");
        auto elapsed = std::chrono::steady_clock::now() - started;
        require(elapsed < std::chrono::seconds(5), "gave up after the request timeout");
    }});

    tests.push_back({"tool_server_registry_connect_reuses_connection", [] {
        TempDir dir;
        auto script = dir / "server.sh";
        mcpguard::tests::write_text(script, mcpguard::tests::fake_mcp_server_script());

        ToolServerRegistry registry(5000);
        registry.register_server("fake", fake_server_config(script));
        std::string error;
        auto first = registry.connect("fake", &error);
        require(first != nullptr, "connected: " + error);
        auto second = registry.connect("fake", &error);
        require(first == second, "live connection reused");

        registry.shutdown();
        registry.shutdown();
        auto* stdio = dynamic_cast<StdioToolServer*>(first.get());
        require(stdio && !stdio->is_running(), "shutdown stops servers");
    }});
}
