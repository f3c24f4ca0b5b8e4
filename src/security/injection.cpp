#include "leakguard/security/injection.hpp"

#include "leakguard/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace leakguard::security {

namespace {

constexpr std::size_t kMinScrambleLength = 3;

bool is_word_byte(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  // Non-ASCII bytes belong to letters of other scripts; keep them inside the token.
  return uch >= 0x80U || std::isalnum(uch) != 0 || ch == '_';
}

std::vector<std::string> word_tokens(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char ch : text) {
    if (is_word_byte(ch)) {
      current.push_back(ch);
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool is_anagram_of(const std::string &word, const std::string_view target) {
  if (word.size() != target.size() || word.size() < kMinScrambleLength) {
    return false;
  }
  std::string sorted_word = word;
  std::string sorted_target(target);
  std::sort(sorted_word.begin(), sorted_word.end());
  std::sort(sorted_target.begin(), sorted_target.end());
  return sorted_word == sorted_target;
}

struct Descrambled {
  std::string text;
  std::string first_token;
};

/// Rewrites every token that is a letter permutation of a trigger word as that trigger word,
/// keeping the separators. Exact spellings are left alone and not recorded.
Descrambled descramble_triggers(const std::string &text_lc) {
  Descrambled out;
  out.text.reserve(text_lc.size());
  std::string current;
  const auto flush = [&out, &current] {
    if (current.empty()) {
      return;
    }
    for (const auto trigger : kTriggerWords) {
      if (current != trigger && is_anagram_of(current, trigger)) {
        if (out.first_token.empty()) {
          out.first_token = current;
        }
        current.assign(trigger);
        break;
      }
    }
    out.text += current;
    current.clear();
  };
  for (const char ch : text_lc) {
    if (is_word_byte(ch)) {
      current.push_back(ch);
      continue;
    }
    flush();
    out.text.push_back(ch);
  }
  flush();
  return out;
}

} // namespace

std::string_view injection_pass_label(const InjectionPass pass) {
  switch (pass) {
  case InjectionPass::Pattern:
    return "pattern";
  case InjectionPass::Fuzzy:
    return "fuzzy";
  }
  return "pattern";
}

bool is_scrambled_variant(const std::string_view word, const std::string_view target) {
  if (word.size() != target.size() || word.size() < kMinScrambleLength) {
    return false;
  }
  if (word.front() != target.front() || word.back() != target.back()) {
    return false;
  }

  std::string word_middle(word.substr(1, word.size() - 2));
  std::string target_middle(target.substr(1, target.size() - 2));
  std::sort(word_middle.begin(), word_middle.end());
  std::sort(target_middle.begin(), target_middle.end());
  return word_middle == target_middle;
}

std::optional<InjectionMatch> find_injection(const std::string &text) {
  if (auto labels = detect_attack_patterns(text); !labels.empty()) {
    return InjectionMatch{InjectionPass::Pattern, std::move(labels.front()), ""};
  }

  const std::string folded = normalize_homoglyphs(text);
  if (folded != text) {
    if (auto labels = detect_attack_patterns(folded); !labels.empty()) {
      return InjectionMatch{InjectionPass::Pattern, std::move(labels.front()), ""};
    }
  }

  const std::string folded_lc = common::to_lower(folded);
  for (const auto &token : word_tokens(folded_lc)) {
    for (const auto trigger : kTriggerWords) {
      if (is_scrambled_variant(token, trigger)) {
        return InjectionMatch{InjectionPass::Fuzzy, std::string(trigger), token};
      }
    }
  }

  // Fully permuted trigger words only count inside a known attack phrasing.
  auto descrambled = descramble_triggers(folded_lc);
  if (!descrambled.first_token.empty()) {
    if (auto labels = detect_attack_patterns(descrambled.text); !labels.empty()) {
      return InjectionMatch{InjectionPass::Fuzzy, std::move(labels.front()),
                            std::move(descrambled.first_token)};
    }
  }
  return std::nullopt;
}

bool detect_injection(const std::string &text) { return find_injection(text).has_value(); }

} // namespace leakguard::security
