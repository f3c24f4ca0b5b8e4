#pragma once

#include "leakguard/leak/finding.hpp"
#include "leakguard/records/record.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leakguard::leak {

/// Inputs shared by every matcher. `doc_lc` is the ASCII-lower-cased form of `doc_raw`.
struct MatchContext {
  const std::string &doc_raw;
  const std::string &doc_lc;
  const std::string &entity_name;
  const records::ConfidentialRecord &record;
};

using MatcherFn = std::vector<LeakFinding> (*)(const MatchContext &context);

struct MatcherEntry {
  /// Confidential field the matcher reads. Findings may carry another category.
  LeakCategory field;
  std::string_view name;
  MatcherFn fn;
};

inline constexpr std::size_t kMatcherCount = 10;

/// Phrases in internal notes that are only reported when the document repeats them.
inline constexpr std::array<std::string_view, 10> kSensitiveNotePhrases = {
    "strategic partnerships", "regulatory pressures",  "operational challenges",
    "financial projections",  "material costs",        "regulatory compliance",
    "market presence",        "competitive advantages", "innovation",
    "pricing",
};

[[nodiscard]] const std::array<MatcherEntry, kMatcherCount> &matcher_registry();
[[nodiscard]] const MatcherEntry *find_matcher(LeakCategory field);

struct KpiParts {
  std::string metric;
  std::string value;
};

/// Splits "<letters/spaces> <digits>[%]" at the start of `kpi`. The metric is untrimmed.
[[nodiscard]] std::optional<KpiParts> split_kpi(const std::string &kpi);

/// All `$<digits>[M|B|K]<spaces><word>` tokens in `text`, in order.
[[nodiscard]] std::vector<std::string> extract_currency_tokens(const std::string &text);

[[nodiscard]] std::vector<LeakFinding> match_entity_name(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_products(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_partnerships(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_methodologies(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_kpis(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_client_profiles(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_financial_estimates(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_expertise_areas(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_risk_category(const MatchContext &context);
[[nodiscard]] std::vector<LeakFinding> match_notes(const MatchContext &context);

} // namespace leakguard::leak
