#include "leakguard/security/injection.hpp"

#include "leakguard/common/utf8.hpp"

#include <cstdint>
#include <regex>

namespace leakguard::security {

namespace {

struct PatternEntry {
  const char *label;
  std::regex regex;
};

const std::array<PatternEntry, 4> kAttackPatterns = {
    PatternEntry{"ignore previous instructions",
                 std::regex(R"(ignore\s+(all\s+)?previous\s+instructions?)", std::regex::icase)},
    PatternEntry{"developer mode",
                 std::regex(R"(you\s+are\s+now\s+(in\s+)?developer\s+mode)", std::regex::icase)},
    PatternEntry{"system override", std::regex(R"(system\s+override)", std::regex::icase)},
    PatternEntry{"reveal prompt", std::regex(R"(reveal\s+prompt)", std::regex::icase)},
};

std::string fold_codepoint(const std::uint32_t cp, const std::string &raw) {
  if (cp >= 0xFF21U && cp <= 0xFF3AU) {
    return std::string(1, static_cast<char>(cp - 0xFEE0U));
  }
  if (cp >= 0xFF41U && cp <= 0xFF5AU) {
    return std::string(1, static_cast<char>(cp - 0xFEE0U));
  }
  if (cp == 0x3000U) {
    return " ";
  }
  return raw;
}

} // namespace

std::vector<std::string> detect_attack_patterns(const std::string &content) {
  std::vector<std::string> matches;
  matches.reserve(kAttackPatterns.size());
  for (const auto &entry : kAttackPatterns) {
    if (std::regex_search(content, entry.regex)) {
      matches.push_back(entry.label);
    }
  }
  return matches;
}

std::string redact_attack_patterns(const std::string &content, const std::string &marker) {
  // ECMAScript format strings treat '$' specially; "$$" writes a literal '$'.
  std::string format;
  format.reserve(marker.size());
  for (const char ch : marker) {
    if (ch == '$') {
      format.push_back('$');
    }
    format.push_back(ch);
  }

  std::string redacted = content;
  for (const auto &entry : kAttackPatterns) {
    redacted = std::regex_replace(redacted, entry.regex, format);
  }
  return redacted;
}

std::string normalize_homoglyphs(const std::string &content) {
  std::string output;
  output.reserve(content.size());

  std::size_t index = 0;
  while (index < content.size()) {
    std::uint32_t cp = 0;
    std::string raw;
    if (!common::decode_utf8_codepoint(content, index, cp, raw)) {
      break;
    }
    output += fold_codepoint(cp, raw);
  }

  return output;
}

} // namespace leakguard::security
