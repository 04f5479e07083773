#include "util/hash.hpp"
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace mcpguard::util {

std::optional<std::string> sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        spdlog::error("EVP_Digest(sha256) failed");
        return std::nullopt;
    }

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::setw(2) << static_cast<int>(digest[i]);
    }
    return out.str();
}

} // namespace mcpguard::util
