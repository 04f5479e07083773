/**
 * mcpguard logging
 *
 * Installs the process-wide spdlog logger. Output goes to stderr so that
 * stdout stays free for command results.
 */
#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace mcpguard::util {

void init_logger();
void set_log_level(spdlog::level::level_enum level);

// Accepts trace/debug/info/warn/error/critical/off; unknown names are ignored
bool set_log_level(const std::string& name);

} // namespace mcpguard::util
