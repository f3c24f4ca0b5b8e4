#pragma once

#include <string>

namespace leakguard::common {

/// Lower-case hex SHA-256 of `text`. Used to refer to scanned documents without logging them.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace leakguard::common
