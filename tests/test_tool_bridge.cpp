#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "bridge/frame.hpp"
#include "bridge/tool_bridge.hpp"
#include "kernel/audit_log.hpp"
#include "policy/capabilities.hpp"

using json = nlohmann::json;
using mcpguard::bridge::BridgeReply;
using mcpguard::bridge::FrameDecoder;
using mcpguard::bridge::ToolBridge;
using mcpguard::core::ErrorKind;
using mcpguard::core::IsolationPolicy;

namespace {

std::shared_ptr<const IsolationPolicy> make_policy(int64_t max_calls) {
    auto policy = std::make_shared<IsolationPolicy>();
    policy->mcp_name = "fake";
    policy->limits.max_tool_calls = max_calls;
    return policy;
}

class RecordingFetcher : public mcpguard::bridge::OutboundFetcher {
public:
    BridgeReply fetch(const std::string& url, const json& init) override {
        urls.push_back(url);
        return BridgeReply::success({{"status", 200}, {"method", init.value("method", "GET")}});
    }
    std::vector<std::string> urls;
};

} // anonymous namespace

void register_tool_bridge_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;
    using mcpguard::tests::FakeConnection;

    // ========================================================================
    // Tool calls
    // ========================================================================

    tests.push_back({"bridge_forwards_known_tool", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"search"});
        ToolBridge bridge("e1", make_policy(10), {"search"}, conn);

        auto reply = bridge.call_tool("search", {{"q", "x"}});
        require(reply.ok, "forwarded");
        require(reply.value["tool"] == "search", "server result returned");
        require(reply.value["args"]["q"] == "x", "arguments passed through");
        require(conn->calls().size() == 1, "one forward");

        auto log = bridge.call_log();
        require(log.size() == 1, "one record");
        require(log[0].sequence_number == 1, "sequence starts at 1");
        require(log[0].success && log[0].tool_name == "search", "record content");
    }});

    tests.push_back({"bridge_unknown_tool_not_forwarded", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"search"});
        ToolBridge bridge("e1", make_policy(10), {"search"}, conn);

        auto reply = bridge.call_tool("delete_everything", json::object());
        require(!reply.ok, "denied");
        require(reply.error && reply.error->kind == ErrorKind::UNKNOWN_TOOL, "UnknownTool");
        require(conn->calls().empty(), "nothing forwarded");
        require(bridge.ledger_used() == 0, "no ledger slot consumed");
        require(bridge.call_log().size() == 1, "attempt still logged");
    }});

    tests.push_back({"bridge_budget_exhausted_after_n_calls", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"search"});
        mcpguard::kernel::AuditLogger audit;
        ToolBridge bridge("e1", make_policy(3), {"search"}, conn, &audit);

        for (int i = 0; i < 3; ++i) {
            require(bridge.call_tool("search", json::object()).ok, "within budget");
        }
        require(bridge.ledger_used() == 3, "exactly N ledger entries");

        auto reply = bridge.call_tool("search", json::object());
        require(!reply.ok, "N+1-th denied");
        require(reply.error->kind == ErrorKind::CALL_BUDGET_EXCEEDED, "CallBudgetExceeded");
        require(bridge.ledger_used() == 3, "ledger unchanged by denial");
        require(conn->calls().size() == 3, "denied call not forwarded");

        auto log = bridge.call_log();
        require(log.size() == 4, "all attempts logged");
        require(log[3].sequence_number == 4, "sequence increments");

        auto security = audit.get_entries(mcpguard::kernel::AuditCategory::SECURITY);
        require(security.size() == 1 && security[0].event_type == "CALL_BUDGET_EXCEEDED",
                "budget exhaustion audited");
    }});

    tests.push_back({"bridge_zero_budget_denies_first_call", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"search"});
        // Bypasses the resolver, which never produces a zero limit
        ToolBridge bridge("e1", make_policy(0), {"search"}, conn);
        auto reply = bridge.call_tool("search", json::object());
        require(!reply.ok && reply.error->kind == ErrorKind::CALL_BUDGET_EXCEEDED, "denied");
    }});

    tests.push_back({"bridge_tool_error_surfaces_to_script", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"fail"});
        ToolBridge bridge("e1", make_policy(10), {"fail"}, conn);
        auto reply = bridge.call_tool("fail", json::object());
        require(!reply.ok, "failed");
        require(reply.error->kind == ErrorKind::TOOL_ERROR, "ToolError");
        require(reply.error->message == "tool exploded", "server message kept");
        require(bridge.ledger_used() == 1, "forwarded call consumed a slot");
    }});

    // ========================================================================
    // Capabilities
    // ========================================================================

    tests.push_back({"bridge_fetch_denied_by_default", [] {
        auto fetcher = std::make_shared<RecordingFetcher>();
        mcpguard::kernel::AuditLogger audit;
        ToolBridge bridge("e1", make_policy(10), {}, nullptr, &audit, fetcher);

        auto reply = bridge.fetch("https://example.com/", json::object());
        require(!reply.ok && reply.error->kind == ErrorKind::NETWORK_DENIED, "NetworkDenied");
        require(fetcher->urls.empty(), "fetcher never reached");
        auto entries = audit.get_entries(mcpguard::kernel::AuditCategory::NETWORK);
        require(entries.size() == 1 && !entries[0].success, "denial audited");
    }});

    tests.push_back({"bridge_fetch_allowed_host", [] {
        auto policy = std::make_shared<IsolationPolicy>();
        policy->network.allowed_hosts = std::set<std::string>{"api.example.com"};
        auto fetcher = std::make_shared<RecordingFetcher>();
        ToolBridge bridge("e1", policy, {}, nullptr, nullptr, fetcher);

        auto reply = bridge.fetch("https://api.example.com/v1", {{"method", "POST"}});
        require(reply.ok, "allowed");
        require(reply.value["method"] == "POST", "init passed to fetcher");
        require(!bridge.fetch("https://evil.com/", json::object()).ok, "other host denied");
        require(fetcher->urls.size() == 1, "only the allowed fetch went out");

        ToolBridge no_fetcher("e2", policy, {}, nullptr);
        auto denied = no_fetcher.fetch("https://api.example.com/v1", json::object());
        require(!denied.ok && denied.error->kind == ErrorKind::NETWORK_DENIED, "no fetcher, no network");
    }});

    tests.push_back({"bridge_file_read_write", [] {
        mcpguard::tests::TempDir dir;
        std::string root = mcpguard::policy::CapabilityChecker::normalize_path(dir.path().string());
        mcpguard::tests::write_text(dir / "in.txt", "hello");

        auto policy = std::make_shared<IsolationPolicy>();
        policy->file_system.enabled = true;
        policy->file_system.read_paths = {root};
        policy->file_system.write_paths = {root + "/out"};
        std::filesystem::create_directories(dir / "out");
        ToolBridge bridge("e1", policy, {}, nullptr);

        auto read = bridge.read_file(root + "/in.txt");
        require(read.ok && read.value == "hello", "read granted file");

        auto write = bridge.write_file(root + "/out/result.txt", "done");
        require(write.ok, "write granted file");
        require(mcpguard::tests::read_text(dir / "out/result.txt") == "done", "content written");

        auto denied = bridge.write_file(root + "/in.txt", "clobber");
        require(!denied.ok && denied.error->kind == ErrorKind::FILE_ACCESS_DENIED, "write denied");
        require(mcpguard::tests::read_text(dir / "in.txt") == "hello", "file untouched");

        auto missing = bridge.read_file(root + "/nope.txt");
        require(!missing.ok && missing.error->kind == ErrorKind::FILE_ACCESS_DENIED, "missing file");
    }});

    // ========================================================================
    // Frames
    // ========================================================================

    tests.push_back({"bridge_handle_frame_dispatch", [] {
        auto conn = std::make_shared<FakeConnection>(std::vector<std::string>{"search"});
        ToolBridge bridge("e1", make_policy(10), {"search"}, conn);

        auto reply = bridge.handle_frame({{"op", "call"}, {"id", 7}, {"tool", "search"}, {"args", {{"a", 1}}}});
        require(reply.ok, "call frame");
        json frame = reply.to_frame(7);
        require(frame["id"] == 7 && frame["ok"] == true, "reply frame header");
        require(frame["value"]["args"]["a"] == 1, "reply value");

        auto bad = bridge.handle_frame({{"op", "call"}, {"id", 8}});
        require(!bad.ok, "call without tool denied");
        json bad_frame = bad.to_frame(8);
        require(bad_frame["error"]["kind"] == "UnknownTool", "error kind serialized");

        require(!bridge.handle_frame({{"op", "spawn"}}).ok, "unknown op denied");
        require(!bridge.handle_frame({{"op", "read"}}).ok, "read without path denied");
    }});

    tests.push_back({"frame_decoder_splits_lines", [] {
        FrameDecoder decoder;
        std::string chunk = "{\"a\":1}\n{\"b\"";
        require(decoder.feed(chunk.data(), chunk.size()), "within limit");
        auto first = decoder.next();
        require(first && *first == "{\"a\":1}", "first frame");
        require(!decoder.next(), "partial frame held back");

        std::string rest = ":2}\n\n";
        decoder.feed(rest.data(), rest.size());
        auto second = decoder.next();
        require(second && *second == "{\"b\":2}", "joined across chunks");
        auto empty = decoder.next();
        require(empty && empty->empty(), "blank line is an empty frame");
        require(decoder.buffered() == 0, "buffer drained");
    }});

    tests.push_back({"frame_decoder_rejects_oversized_frame", [] {
        FrameDecoder decoder(8);
        std::string ok = "1234567\n";
        require(decoder.feed(ok.data(), ok.size()), "frame at limit accepted");
        std::string big = "123456789";
        require(!decoder.feed(big.data(), big.size()), "unterminated frame over limit");
    }});

    tests.push_back({"frame_op_parsing", [] {
        using mcpguard::bridge::FrameOp;
        require(mcpguard::bridge::frame_op({{"op", "result"}}) == FrameOp::RESULT, "result");
        require(mcpguard::bridge::frame_op({{"op", 3}}) == FrameOp::UNKNOWN, "non-string op");
        require(mcpguard::bridge::frame_op(json::array()) == FrameOp::UNKNOWN, "non-object");
    }});
}
