#include "kernel/audit_log.hpp"
#include "core/types.hpp"
#include <spdlog/spdlog.h>

#include <iterator>

namespace mcpguard::kernel {

using json = nlohmann::json;

json AuditLogEntry::to_json() const {
    json j = {
        {"id", id},
        {"timestamp", core::format_timestamp(timestamp)},
        {"category", audit_category_to_string(category)},
        {"event_type", event_type},
        {"success", success},
        {"details", details}
    };
    // Orchestrator-level events carry neither
    if (!execution_id.empty()) j["execution_id"] = execution_id;
    if (!mcp_name.empty()) j["mcp_name"] = mcp_name;
    return j;
}

std::string AuditLogEntry::to_jsonl() const {
    return core::dump_json(to_json()) + "\n";
}

bool AuditQuery::matches(const AuditLogEntry& entry) const {
    return entry.id > since_id &&
           (!category || entry.category == *category) &&
           (execution_id.empty() || entry.execution_id == execution_id);
}

// ============================================================================
// AuditLogger
// ============================================================================

AuditLogger::AuditLogger(AuditConfig config) : config_(std::move(config)) {}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      const std::string& execution_id,
                      const std::string& mcp_name,
                      const json& details,
                      bool success) {
    if (!config_.is_enabled(category)) {
        return;
    }
    spdlog::trace("Audit[{}]: {} execution={} success={}",
                  audit_category_to_string(category), event_type, execution_id, success);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(AuditLogEntry{next_id_++, std::chrono::system_clock::now(), category,
                                     event_type, execution_id, mcp_name, details, success});
    if (entries_.size() > config_.max_entries) {
        entries_.erase(entries_.begin(),
                       entries_.begin() + static_cast<std::ptrdiff_t>(entries_.size() - config_.max_entries));
    }
}

void AuditLogger::log_security(const std::string& event_type,
                               const std::string& execution_id,
                               const std::string& mcp_name,
                               const json& details) {
    log(AuditCategory::SECURITY, event_type, execution_id, mcp_name, details, false);
}

void AuditLogger::log_execution(const std::string& event_type,
                                const std::string& execution_id,
                                const std::string& mcp_name,
                                const json& details,
                                bool success) {
    log(AuditCategory::EXECUTION, event_type, execution_id, mcp_name, details, success);
}

std::vector<AuditLogEntry> AuditLogger::query(const AuditQuery& q, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Walk back from the newest until the limit is met
    auto first = entries_.end();
    size_t found = 0;
    for (auto it = entries_.end(); it != entries_.begin() && found < limit;) {
        --it;
        if (q.matches(*it)) {
            first = it;
            found++;
        }
    }

    std::vector<AuditLogEntry> result;
    result.reserve(found);
    for (auto it = first; it != entries_.end(); ++it) {
        if (q.matches(*it)) result.push_back(*it);
    }
    return result;
}

std::string AuditLogger::export_jsonl(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t skip = (limit > 0 && entries_.size() > limit) ? entries_.size() - limit : 0;
    std::string out;
    for (auto it = std::next(entries_.begin(), static_cast<std::ptrdiff_t>(skip)); it != entries_.end(); ++it) {
        out += it->to_jsonl();
    }
    return out;
}

void AuditLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

} // namespace mcpguard::kernel
