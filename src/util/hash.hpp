#pragma once
#include <string>
#include <optional>

namespace mcpguard::util {

// Lowercase hex SHA-256 digest (64 chars), nullopt if OpenSSL fails
std::optional<std::string> sha256_hex(const std::string& data);

} // namespace mcpguard::util
