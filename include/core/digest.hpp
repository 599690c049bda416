#pragma once

#include <string>
#include <string_view>

namespace rlsengine::utils {

/**
 * @brief Lowercase hex SHA-256 of the input (OpenSSL EVP)
 * @return 64-char hex string, or empty string if the digest context fails
 */
[[nodiscard]] std::string sha256_hex(std::string_view input);

} // namespace rlsengine::utils
