#include "leakguard/security/output_validator.hpp"

#include "leakguard/common/utf8.hpp"

#include <array>
#include <regex>

namespace leakguard::security {

namespace {

struct OutputPattern {
  const char *label;
  std::regex regex;
};

const std::array<OutputPattern, 2> &output_patterns() {
  static const std::array<OutputPattern, 2> patterns = {
      OutputPattern{"system prompt echo",
                    std::regex(R"(SYSTEM\s*[:]\s*You\s+are)", std::regex::icase)},
      OutputPattern{"numbered instructions",
                    std::regex(R"(instructions?[:]\s*\d+\.)", std::regex::icase)},
  };
  return patterns;
}

} // namespace

std::optional<std::string> find_output_violation(const std::string &text) {
  for (const auto &pattern : output_patterns()) {
    if (std::regex_search(text, pattern.regex)) {
      return std::string(pattern.label);
    }
  }
  return std::nullopt;
}

bool validate_output(const std::string &text) { return !find_output_violation(text).has_value(); }

std::string filter_output(const std::string &text, const std::size_t max_chars) {
  if (!validate_output(text) || common::utf8_length(text) > max_chars) {
    return REFUSAL_MESSAGE;
  }
  return text;
}

} // namespace leakguard::security
