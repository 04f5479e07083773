#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpguard::util {

void init_logger() {
    if (auto existing = spdlog::get("mcpguard")) {
        spdlog::set_default_logger(existing);
        return;
    }
    auto console = spdlog::stderr_color_mt("mcpguard");
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool set_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', keeping current level", name);
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace mcpguard::util
