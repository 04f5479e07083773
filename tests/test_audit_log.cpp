#include "test_framework.hpp"
#include "kernel/audit_log.hpp"
#include <sstream>

using json = nlohmann::json;
using mcpguard::kernel::AuditCategory;
using mcpguard::kernel::AuditConfig;
using mcpguard::kernel::AuditLogger;
using mcpguard::kernel::AuditQuery;

void register_audit_log_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;

    tests.push_back({"audit_filters_by_category_and_execution", [] {
        AuditLogger audit;
        audit.log_security("POLICY_VIOLATION", "e1", "github", {{"pattern", "eval("}});
        audit.log_execution("EXECUTION_STARTED", "e1", "github", json::object());
        audit.log_execution("EXECUTION_STARTED", "e2", "github", json::object());
        audit.log(AuditCategory::TOOL_CALL, "TOOL_CALL", "e2", "github", {{"tool", "search"}}, false);

        require(audit.entry_count() == 4, "all recorded");
        require(audit.get_entries(AuditCategory::EXECUTION).size() == 2, "by category");
        require(audit.get_entries(std::nullopt, "e2").size() == 2, "by execution");

        auto calls = audit.get_entries(AuditCategory::TOOL_CALL, "e2");
        require(calls.size() == 1 && !calls[0].success, "failure flag kept");
        require(calls[0].details["tool"] == "search", "details kept");
    }});

    tests.push_back({"audit_since_id_and_limit", [] {
        AuditLogger audit;
        for (int i = 0; i < 10; ++i) {
            audit.log_execution("EVENT_" + std::to_string(i), "e", "", json::object());
        }
        require(audit.last_entry_id() == 10, "ids count from 1");

        auto newer = audit.get_entries(std::nullopt, "", 7);
        require(newer.size() == 3 && newer.front().id == 8, "entries after since_id");

        auto recent = audit.get_entries(std::nullopt, "", 0, 2);
        require(recent.size() == 2, "limited");
        require(recent[0].event_type == "EVENT_8" && recent[1].event_type == "EVENT_9",
                "limit keeps the newest, oldest first");
    }});

    tests.push_back({"audit_query_combines_filters", [] {
        AuditLogger audit;
        for (int i = 0; i < 6; ++i) {
            audit.log_execution("RUN_" + std::to_string(i), i % 2 ? "odd" : "even", "", json::object());
        }
        audit.log_security("DEGRADED_ISOLATION", "odd", "", json::object());

        AuditQuery q;
        q.category = AuditCategory::EXECUTION;
        q.execution_id = "odd";
        auto odd = audit.query(q);
        require(odd.size() == 3 && odd.back().event_type == "RUN_5", "category and execution");

        q.since_id = 2;
        auto later = audit.query(q, 1);
        require(later.size() == 1 && later[0].event_type == "RUN_5", "since id with limit");
        require(audit.query(AuditQuery{}, 0).empty(), "zero limit");
    }});

    tests.push_back({"audit_bounded_and_disabled_categories", [] {
        AuditConfig config;
        config.max_entries = 3;
        config.muted = {AuditCategory::TOOL_CALL};
        AuditLogger audit(config);

        audit.log(AuditCategory::TOOL_CALL, "TOOL_CALL", "e", "", json::object());
        require(audit.entry_count() == 0, "disabled category dropped");

        for (int i = 0; i < 5; ++i) {
            audit.log_security("EVENT_" + std::to_string(i), "e", "", json::object());
        }
        require(audit.entry_count() == 3, "oldest trimmed");
        require(audit.get_entries().front().event_type == "EVENT_2", "newest three kept");
        require(audit.last_entry_id() == 5, "ids keep counting");

        audit.clear();
        require(audit.entry_count() == 0, "cleared");
    }});

    tests.push_back({"audit_export_jsonl", [] {
        AuditLogger audit;
        audit.log(AuditCategory::NETWORK, "FETCH_DENIED", "e1", "github",
                  {{"host", "evil.com"}}, false);
        audit.log(AuditCategory::FILESYSTEM, "FILE_READ", "", "", {{"path", "/data/x"}});

        std::istringstream lines(audit.export_jsonl());
        std::string line;
        std::vector<json> parsed;
        while (std::getline(lines, line)) {
            if (!line.empty()) parsed.push_back(json::parse(line));
        }
        require(parsed.size() == 2, "one line per entry");
        require(parsed[0]["category"] == "NETWORK", "category string");
        require(parsed[0]["execution_id"] == "e1", "execution id");
        require(parsed[0]["success"] == false, "success flag");
        require(!parsed[1].contains("execution_id"), "orchestrator-level entry has no id");
        require(parsed[1]["timestamp"].is_string(), "timestamp");
    }});

    tests.push_back({"audit_category_names_round_trip", [] {
        for (auto cat : {AuditCategory::SECURITY, AuditCategory::EXECUTION, AuditCategory::TOOL_CALL,
                         AuditCategory::SCHEMA_CACHE, AuditCategory::NETWORK, AuditCategory::FILESYSTEM}) {
            auto name = mcpguard::kernel::audit_category_to_string(cat);
            require(mcpguard::kernel::audit_category_from_string(name) == cat, name);
        }
        require(!mcpguard::kernel::audit_category_from_string("ISOLATION"), "unknown name");
    }});
}
