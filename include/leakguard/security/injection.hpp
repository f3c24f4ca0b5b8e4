#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leakguard::security {

inline constexpr const char *REDACTION_MARKER = "[FILTERED]";
inline constexpr std::size_t kMaxInputChars = 10'000;

/// Words whose interior-scrambled spellings are treated as injection attempts.
inline constexpr std::array<std::string_view, 6> kTriggerWords = {
    "ignore", "bypass", "override", "reveal", "delete", "system",
};

enum class InjectionPass { Pattern, Fuzzy };

struct InjectionMatch {
  InjectionPass pass = InjectionPass::Pattern;
  /// Attack pattern label, or the trigger word for a single scrambled token.
  std::string label;
  /// Offending token for fuzzy matches; empty for pattern matches.
  std::string token;
};

[[nodiscard]] std::string_view injection_pass_label(InjectionPass pass);

/// Labels of every known attack phrasing found in `content` (case-insensitive).
[[nodiscard]] std::vector<std::string> detect_attack_patterns(const std::string &content);

/// Replaces every attack phrasing with `marker`.
[[nodiscard]] std::string redact_attack_patterns(const std::string &content,
                                                 const std::string &marker = REDACTION_MARKER);

/// Folds fullwidth ASCII letters and the ideographic space to plain ASCII.
[[nodiscard]] std::string normalize_homoglyphs(const std::string &content);

/// True when `word` has the length, first and last letter of `target` (length >= 3) and the
/// same interior letters in any order. Exact spellings qualify.
[[nodiscard]] bool is_scrambled_variant(std::string_view word, std::string_view target);

/// Runs the pattern pass over `text` and its homoglyph-folded form, then the fuzzy pass: single
/// scrambled trigger tokens, then attack phrasings whose trigger words were fully permuted.
[[nodiscard]] std::optional<InjectionMatch> find_injection(const std::string &text);
[[nodiscard]] bool detect_injection(const std::string &text);

/// Collapses whitespace and character floods, redacts attack phrasings and caps the length.
[[nodiscard]] std::string sanitize_input(const std::string &text,
                                         std::size_t max_chars = kMaxInputChars);

} // namespace leakguard::security
