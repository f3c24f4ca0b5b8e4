#include "leakguard/security/injection.hpp"

#include "leakguard/common/utf8.hpp"

#include <cctype>
#include <cstdint>

namespace leakguard::security {

namespace {

/// Runs of at least this many identical characters shrink to a single character.
constexpr std::size_t kFloodRunLength = 4;

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool in_space = false;
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_space) {
        out.push_back(' ');
      }
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(ch);
  }
  return out;
}

void flush_run(std::string &out, const std::string &raw, const std::size_t length) {
  if (length >= kFloodRunLength) {
    out += raw;
    return;
  }
  for (std::size_t i = 0; i < length; ++i) {
    out += raw;
  }
}

std::string collapse_floods(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  std::string run_raw;
  std::size_t run_length = 0;
  std::size_t index = 0;
  std::uint32_t cp = 0;
  std::string raw;
  while (common::decode_utf8_codepoint(text, index, cp, raw)) {
    if (run_length > 0 && raw == run_raw) {
      ++run_length;
      continue;
    }
    flush_run(out, run_raw, run_length);
    run_raw = raw;
    run_length = 1;
  }
  flush_run(out, run_raw, run_length);
  return out;
}

} // namespace

std::string sanitize_input(const std::string &text, const std::size_t max_chars) {
  std::string sanitized = collapse_whitespace(text);
  sanitized = collapse_floods(sanitized);
  sanitized = redact_attack_patterns(sanitized);
  // Brackets next to a marker can form a new run, e.g. "[[[" + "[FILTERED]".
  sanitized = collapse_floods(sanitized);
  return common::utf8_truncate(sanitized, max_chars);
}

} // namespace leakguard::security
