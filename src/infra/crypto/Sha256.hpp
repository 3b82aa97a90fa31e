#pragma once

#include <string>
#include <string_view>

namespace infra::crypto {

// Lower-case hex SHA-256 of `data`. Throws std::runtime_error when OpenSSL fails.
std::string sha256_hex(std::string_view data);

}  // namespace infra::crypto
