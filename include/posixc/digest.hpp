#pragma once
#include <string>

namespace posixc {
// Lowercase hex SHA-256 of text.
std::string sha256_hex(const std::string& text);
} // namespace posixc
