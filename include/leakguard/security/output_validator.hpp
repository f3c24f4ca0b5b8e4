#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace leakguard::security {

inline constexpr const char *REFUSAL_MESSAGE =
    "I cannot provide that information for security reasons.";
inline constexpr std::size_t kMaxOutputChars = 5'000;

/// Label of the first prompt-disclosure shape found in `text`, if any.
[[nodiscard]] std::optional<std::string> find_output_violation(const std::string &text);

/// True when `text` is safe to return to a user.
[[nodiscard]] bool validate_output(const std::string &text);

/// `text` unchanged when safe and within `max_chars` characters, otherwise the refusal message.
[[nodiscard]] std::string filter_output(const std::string &text,
                                        std::size_t max_chars = kMaxOutputChars);

} // namespace leakguard::security
