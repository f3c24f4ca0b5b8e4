#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace leakguard::common {

/// Decodes the code point at `index` and advances past it. Invalid or truncated sequences
/// decode as their lead byte so that no input is ever dropped.
bool decode_utf8_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp,
                           std::string &raw);

[[nodiscard]] std::size_t utf8_length(const std::string &input);

/// First `max_codepoints` code points of `input`.
[[nodiscard]] std::string utf8_truncate(const std::string &input, std::size_t max_codepoints);

/// Lower-cases ASCII, Latin-1 and Latin Extended-A letters. Other code points and invalid
/// bytes pass through unchanged.
[[nodiscard]] std::string utf8_to_lower(const std::string &input);

} // namespace leakguard::common
