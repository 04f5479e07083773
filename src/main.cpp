#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include "config/orchestrator_config.hpp"
#include "config/settings_store.hpp"
#include "schema/schema_cache.hpp"
#include "bridge/tool_server.hpp"
#include "kernel/audit_log.hpp"
#include "kernel/execution_supervisor.hpp"
#include "kernel/control_service.hpp"
#include "ipc/control_client.hpp"
#include "policy/script_validator.hpp"
#include "util/logger.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <thread>
#include <pthread.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;
using mcpguard::config::OrchestratorConfig;

// ANSI escape codes
namespace term {
    constexpr const char* RESET  = "\033[0m";
    constexpr const char* BOLD   = "\033[1m";
    constexpr const char* DIM    = "\033[2m";
    constexpr const char* CYAN   = "\033[36m";
    constexpr const char* GREEN  = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* RED    = "\033[31m";
}

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    std::cerr <<
R"(usage: mcpguard [options] <command> [args]

commands:
  run <script|->        execute a script in-process and print the result
  validate <script|->   run the static pre-flight check only
  serve                 start the orchestrator on the control socket
  submit <script|->     execute a script through a running orchestrator
  cancel <id>           cancel an in-flight execution
  active                list in-flight execution ids
  schema <mcpName>      show the cached tool schema for a server
  invalidate <mcpName>  drop cached schemas for a server
  audit                 print audit log entries as JSON lines
  stop                  shut down a running orchestrator

options:
  --config PATH         orchestrator config (default ~/.mcpguard/orchestrator.json)
  --socket PATH         control socket path
  --settings PATH       settings store path
  --servers PATH        mcpServers document
  --scratch DIR         scratch workspace root
  --log-level LEVEL     trace|debug|info|warn|error|off
  --no-namespaces       do not create user/pid/net namespaces
  --no-cgroups          do not place runtimes in a cgroup

run/submit options:
  --server NAME         target tool server (required)
  --input JSON          input arguments object
  --policy PATH         isolation policy JSON; default is resolved from settings
  --id ID               execution id; generated when omitted

schema options:
  --hash HASH           configuration fingerprint; default is the current one

audit options:
  --category NAME       SECURITY|EXECUTION|TOOL_CALL|SCHEMA_CACHE|NETWORK|FILESYSTEM
  --execution ID        only entries for one execution
  --since ID            only entries after this id
  --limit N             maximum number of entries (default 100)
)";
}

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool no_namespaces = false;
    bool no_cgroups = false;

    std::string option(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }
    bool has(const std::string& name) const { return options.count(name) > 0; }
};

std::optional<CommandLine> parse_command_line(int argc, char** argv) {
    static const std::set<std::string> valued = {
        "--config", "--socket", "--settings", "--servers", "--scratch", "--log-level",
        "--server", "--input", "--policy", "--id", "--hash",
        "--category", "--execution", "--since", "--limit"
    };

    CommandLine cl;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--no-namespaces") {
            cl.no_namespaces = true;
        } else if (arg == "--no-cgroups") {
            cl.no_cgroups = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (valued.count(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "mcpguard: " << arg << " needs a value\n";
                return std::nullopt;
            }
            cl.options[arg] = argv[++i];
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::cerr << "mcpguard: unknown option " << arg << "\n";
            return std::nullopt;
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.positional.push_back(arg);
        }
    }
    if (cl.command.empty()) {
        return std::nullopt;
    }
    return cl;
}

// defaults < config file < environment < flags
bool load_config(const CommandLine& cl, OrchestratorConfig& config) {
    std::string error;
    std::string path = cl.option("--config");
    if (!path.empty()) {
        if (!config.load_file(path, &error)) {
            std::cerr << "mcpguard: " << error << "\n";
            return false;
        }
    } else {
        path = OrchestratorConfig::default_config_path();
        std::error_code ec;
        if (fs::exists(path, ec) && !config.load_file(path, &error)) {
            std::cerr << "mcpguard: " << error << "\n";
            return false;
        }
    }

    config.apply_environment();

    if (cl.has("--socket")) config.socket_path = cl.option("--socket");
    if (cl.has("--settings")) config.settings_path = cl.option("--settings");
    if (cl.has("--servers")) config.servers_path = cl.option("--servers");
    if (cl.has("--scratch")) config.scratch_root = cl.option("--scratch");
    if (cl.has("--log-level")) config.log_level = cl.option("--log-level");
    if (cl.no_namespaces) config.enable_namespaces = false;
    if (cl.no_cgroups) config.enable_cgroups = false;

    mcpguard::util::set_log_level(config.log_level);
    return true;
}

std::optional<std::string> read_script(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        std::cerr << "mcpguard: cannot open " << path << "\n";
        return std::nullopt;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Builds the request document the control protocol also accepts
std::optional<json> build_request(const CommandLine& cl) {
    if (cl.positional.size() != 1) {
        std::cerr << "mcpguard: " << cl.command << " needs exactly one script path (or -)\n";
        return std::nullopt;
    }
    if (!cl.has("--server")) {
        std::cerr << "mcpguard: " << cl.command << " needs --server NAME\n";
        return std::nullopt;
    }
    auto script = read_script(cl.positional[0]);
    if (!script) {
        return std::nullopt;
    }

    json request = {
        {"scriptSource", *script},
        {"targetServer", cl.option("--server")},
        {"inputArgs", json::object()}
    };
    if (cl.has("--id")) {
        request["id"] = cl.option("--id");
    }

    try {
        if (cl.has("--input")) {
            request["inputArgs"] = json::parse(cl.option("--input"));
        }
        if (cl.has("--policy")) {
            std::ifstream ifs(cl.option("--policy"));
            if (!ifs.is_open()) {
                std::cerr << "mcpguard: cannot open " << cl.option("--policy") << "\n";
                return std::nullopt;
            }
            request["policy"] = json::parse(ifs);
        }
    } catch (const json::parse_error& e) {
        std::cerr << "mcpguard: invalid JSON: " << e.what() << "\n";
        return std::nullopt;
    }
    return request;
}

void print_result_summary(const json& result) {
    bool ok = result.value("finalPhase", "") == "Completed";
    if (!isatty(STDERR_FILENO)) {
        return;
    }
    if (ok) {
        std::cerr << term::GREEN << term::BOLD << "completed" << term::RESET
                  << term::DIM << "  " << result.value("durationMs", 0) << " ms" << term::RESET << "\n";
        return;
    }
    std::string kind = "UNKNOWN";
    std::string message;
    if (result.contains("error") && result["error"].is_object()) {
        kind = result["error"].value("kind", kind);
        message = result["error"].value("message", "");
    }
    std::cerr << term::RED << term::BOLD << "failed" << term::RESET << "  "
              << term::YELLOW << kind << term::RESET << "  " << message << "\n";
}

// ============================================================================
// Local commands
// ============================================================================

int cmd_validate(const CommandLine& cl, const OrchestratorConfig& config) {
    if (cl.positional.size() != 1) {
        std::cerr << "mcpguard: validate needs exactly one script path (or -)\n";
        return EXIT_USAGE;
    }
    auto script = read_script(cl.positional[0]);
    if (!script) {
        return EXIT_USAGE;
    }

    mcpguard::policy::ScriptValidator validator(config.max_script_bytes);
    auto result = validator.validate(*script);
    json out = {{"ok", result.ok}};
    if (!result.ok) {
        out["pattern"] = result.pattern;
        out["line"] = result.line;
        out["column"] = result.column;
        out["message"] = result.message;
    }
    std::cout << mcpguard::core::dump_json(out, 2) << std::endl;
    return result.ok ? EXIT_OK : EXIT_FAILED;
}

int cmd_run(const CommandLine& cl, const OrchestratorConfig& config) {
    auto request_json = build_request(cl);
    if (!request_json) {
        return EXIT_USAGE;
    }
    std::string error;
    auto request = mcpguard::core::ExecutionRequest::from_json(*request_json, &error);
    if (!request) {
        std::cerr << "mcpguard: " << error << "\n";
        return EXIT_USAGE;
    }
    if (request->id.empty()) {
        request->id = mcpguard::kernel::ExecutionSupervisor::generate_id();
    }

    auto settings = mcpguard::config::SettingsStore::open_file(config.resolved_settings_path());
    mcpguard::schema::SchemaCache cache(*settings);
    mcpguard::bridge::ToolServerRegistry registry(config.tool_call_timeout_ms);
    if (!config.servers_path.empty() && !registry.load_file(config.servers_path, &error)) {
        std::cerr << "mcpguard: " << error << "\n";
        return EXIT_USAGE;
    }
    mcpguard::kernel::AuditLogger audit;

    // SIGINT/SIGTERM cancel the run instead of killing the process, so the
    // sandbox is torn down and the scratch workspace removed
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    int exit_code = EXIT_FAILED;
    {
        mcpguard::kernel::ExecutionSupervisor supervisor(
            mcpguard::runtime::RunnerOptions::from_config(config), config.max_script_bytes,
            *settings, cache, registry, &audit);

        std::atomic<bool> done{false};
        std::string id = request->id;
        std::thread watcher([&supervisor, &done, &stop_signals, id]() {
            struct timespec tick = {0, 200 * 1000 * 1000};
            while (!done.load()) {
                int sig = sigtimedwait(&stop_signals, nullptr, &tick);
                if (sig > 0) {
                    spdlog::warn("Received signal {}, cancelling {}", sig, id);
                    supervisor.cancel(id);
                }
            }
        });

        auto result = supervisor.submit(std::move(*request));
        done = true;
        watcher.join();

        json out = result.to_json();
        std::cout << mcpguard::core::dump_json(out, 2) << std::endl;
        print_result_summary(out);
        exit_code = result.succeeded() ? EXIT_OK : EXIT_FAILED;
    }

    registry.shutdown();
    pthread_sigmask(SIG_UNBLOCK, &stop_signals, nullptr);
    return exit_code;
}

int cmd_serve(const OrchestratorConfig& config) {
    mcpguard::kernel::ControlService service(config);
    if (!service.init()) {
        std::cerr << "\n    " << term::RED << term::BOLD << "x" << term::RESET
                  << "  Failed to initialize orchestrator\n\n";
        return EXIT_FAILED;
    }

    if (isatty(STDERR_FILENO)) {
        std::cerr << "\n" << term::CYAN << term::BOLD << "    mcpguard" << term::RESET
                  << term::DIM << "  sandbox execution orchestrator\n" << term::RESET;
        std::cerr << "    socket      " << term::YELLOW << config.socket_path << term::RESET << "\n";
        std::cerr << "    settings    " << config.resolved_settings_path() << "\n";
        std::cerr << "    namespaces  " << (config.enable_namespaces ? term::GREEN : term::YELLOW)
                  << (config.enable_namespaces ? "enabled" : "disabled") << term::RESET << "\n";
        std::cerr << "    cgroups     " << (config.enable_cgroups ? term::GREEN : term::YELLOW)
                  << (config.enable_cgroups ? "enabled" : "disabled") << term::RESET << "\n";
        std::cerr << term::DIM << "    Press Ctrl+C to shutdown\n\n" << term::RESET;
    }

    service.run();
    return EXIT_OK;
}

// ============================================================================
// Control socket commands
// ============================================================================

std::optional<json> remote_call(const OrchestratorConfig& config, mcpguard::ipc::ControlOp op,
                                const json& payload, int timeout_ms = 10000) {
    mcpguard::ipc::ControlClient client(config.socket_path);
    std::string error;
    auto response = client.call(op, payload, timeout_ms, &error);
    if (!response) {
        std::cerr << "mcpguard: " << error << "\n";
        return std::nullopt;
    }
    if (!response->value("ok", false)) {
        std::cerr << "mcpguard: " << response->value("error", "request failed") << "\n";
        return std::nullopt;
    }
    return response;
}

int cmd_submit(const CommandLine& cl, const OrchestratorConfig& config) {
    auto request = build_request(cl);
    if (!request) {
        return EXIT_USAGE;
    }
    auto response = remote_call(config, mcpguard::ipc::ControlOp::SUBMIT, *request, 0);
    if (!response) {
        return EXIT_FAILED;
    }
    const json& result = (*response)["result"];
    std::cout << mcpguard::core::dump_json(result, 2) << std::endl;
    print_result_summary(result);
    return result.value("finalPhase", "") == "Completed" ? EXIT_OK : EXIT_FAILED;
}

int cmd_cancel(const CommandLine& cl, const OrchestratorConfig& config) {
    if (cl.positional.size() != 1) {
        std::cerr << "mcpguard: cancel needs an execution id\n";
        return EXIT_USAGE;
    }
    auto response = remote_call(config, mcpguard::ipc::ControlOp::CANCEL, {{"id", cl.positional[0]}});
    if (!response) {
        return EXIT_FAILED;
    }
    std::cout << mcpguard::core::dump_json(*response, 2) << std::endl;
    return response->value("cancelled", false) ? EXIT_OK : EXIT_FAILED;
}

int cmd_schema(const CommandLine& cl, const OrchestratorConfig& config, bool invalidate) {
    if (cl.positional.size() != 1) {
        std::cerr << "mcpguard: " << cl.command << " needs a tool server name\n";
        return EXIT_USAGE;
    }
    json payload = {{"mcpName", cl.positional[0]}};
    auto op = mcpguard::ipc::ControlOp::INVALIDATE_SCHEMA;
    if (!invalidate) {
        op = mcpguard::ipc::ControlOp::GET_SCHEMA;
        if (cl.has("--hash")) {
            payload["configHash"] = cl.option("--hash");
        }
    }
    auto response = remote_call(config, op, payload);
    if (!response) {
        return EXIT_FAILED;
    }
    std::cout << mcpguard::core::dump_json(*response, 2) << std::endl;
    if (!invalidate && !response->value("hit", false)) {
        return EXIT_FAILED;
    }
    return EXIT_OK;
}

int cmd_audit(const CommandLine& cl, const OrchestratorConfig& config) {
    json payload = json::object();
    if (cl.has("--category")) payload["category"] = cl.option("--category");
    if (cl.has("--execution")) payload["executionId"] = cl.option("--execution");
    try {
        if (cl.has("--since")) payload["sinceId"] = std::stoull(cl.option("--since"));
        if (cl.has("--limit")) payload["limit"] = std::stoull(cl.option("--limit"));
    } catch (const std::exception&) {
        std::cerr << "mcpguard: --since and --limit take non-negative integers\n";
        return EXIT_USAGE;
    }

    auto response = remote_call(config, mcpguard::ipc::ControlOp::GET_AUDIT_LOG, payload);
    if (!response) {
        return EXIT_FAILED;
    }
    for (const auto& entry : (*response)["entries"]) {
        std::cout << mcpguard::core::dump_json(entry) << "\n";
    }
    std::cout.flush();
    return EXIT_OK;
}

int cmd_simple(const OrchestratorConfig& config, mcpguard::ipc::ControlOp op) {
    auto response = remote_call(config, op, json::object());
    if (!response) {
        return EXIT_FAILED;
    }
    std::cout << mcpguard::core::dump_json(*response, 2) << std::endl;
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char** argv) {
    // Writes to a runtime or tool server that exited must not kill us
    signal(SIGPIPE, SIG_IGN);

    mcpguard::util::init_logger();

    auto cl = parse_command_line(argc, argv);
    if (!cl) {
        print_usage();
        return EXIT_USAGE;
    }

    OrchestratorConfig config;
    if (!load_config(*cl, config)) {
        return EXIT_USAGE;
    }

    const std::string& cmd = cl->command;
    if (cmd == "run") return cmd_run(*cl, config);
    if (cmd == "validate") return cmd_validate(*cl, config);
    if (cmd == "serve") return cmd_serve(config);
    if (cmd == "submit") return cmd_submit(*cl, config);
    if (cmd == "cancel") return cmd_cancel(*cl, config);
    if (cmd == "active") return cmd_simple(config, mcpguard::ipc::ControlOp::LIST_ACTIVE);
    if (cmd == "schema") return cmd_schema(*cl, config, false);
    if (cmd == "invalidate") return cmd_schema(*cl, config, true);
    if (cmd == "audit") return cmd_audit(*cl, config);
    if (cmd == "stop") return cmd_simple(config, mcpguard::ipc::ControlOp::SHUTDOWN);

    std::cerr << "mcpguard: unknown command '" << cmd << "'\n";
    print_usage();
    return EXIT_USAGE;
}
