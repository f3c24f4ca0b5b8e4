#include "leakguard/leak/matchers.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/common/utf8.hpp"

#include <regex>

namespace leakguard::leak {

namespace {

const std::regex kKpiPattern(R"(^([A-Za-z\s]+)\s+(\d+%?))");
const std::regex kCurrencyPattern(R"(\$\d+[MBK]?\s*\w*)");

constexpr std::size_t kMinPartnershipDetailsLength = 20;
constexpr std::size_t kPartnershipPhraseWords = 10;

/// Case-insensitive containment against the lower-cased document. Empty needles never match.
bool mentions(const MatchContext &context, const std::string &needle) {
  if (needle.empty()) {
    return false;
  }
  return common::contains(context.doc_lc, common::utf8_to_lower(needle));
}

LeakFinding finding(const LeakCategory category, const MatchContext &context,
                    std::string detail) {
  return LeakFinding{category, context.entity_name, std::move(detail)};
}

std::vector<LeakFinding> match_members(const MatchContext &context,
                                       const std::vector<std::string> &members,
                                       const LeakCategory category) {
  std::vector<LeakFinding> out;
  for (const auto &member : members) {
    if (mentions(context, member)) {
      out.push_back(finding(category, context, member));
    }
  }
  return out;
}

std::string leading_phrase(const std::string &text, const std::size_t words) {
  const auto tokens = common::split_whitespace(common::utf8_to_lower(text));
  std::string phrase;
  for (std::size_t i = 0; i < tokens.size() && i < words; ++i) {
    if (i > 0) {
      phrase.push_back(' ');
    }
    phrase += tokens[i];
  }
  return phrase;
}

const std::array<MatcherEntry, kMatcherCount> kRegistry = {
    MatcherEntry{LeakCategory::EntityNames, "entity_names", &match_entity_name},
    MatcherEntry{LeakCategory::ProductNames, "product_names", &match_products},
    MatcherEntry{LeakCategory::Partnerships, "partnerships", &match_partnerships},
    MatcherEntry{LeakCategory::Methodologies, "methodologies", &match_methodologies},
    MatcherEntry{LeakCategory::Kpis, "kpis", &match_kpis},
    MatcherEntry{LeakCategory::ClientProfiles, "client_profiles", &match_client_profiles},
    MatcherEntry{LeakCategory::FinancialEstimates, "financial_estimates",
                 &match_financial_estimates},
    MatcherEntry{LeakCategory::ExpertiseAreas, "expertise_areas", &match_expertise_areas},
    MatcherEntry{LeakCategory::RiskCategories, "risk_categories", &match_risk_category},
    MatcherEntry{LeakCategory::NotesContent, "notes_content", &match_notes},
};

} // namespace

const std::array<MatcherEntry, kMatcherCount> &matcher_registry() { return kRegistry; }

const MatcherEntry *find_matcher(const LeakCategory field) {
  for (const auto &entry : kRegistry) {
    if (entry.field == field) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<KpiParts> split_kpi(const std::string &kpi) {
  std::smatch match;
  if (!std::regex_search(kpi, match, kKpiPattern)) {
    return std::nullopt;
  }
  return KpiParts{match[1].str(), match[2].str()};
}

std::vector<std::string> extract_currency_tokens(const std::string &text) {
  std::vector<std::string> tokens;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kCurrencyPattern);
       it != std::sregex_iterator(); ++it) {
    tokens.push_back(it->str());
  }
  return tokens;
}

std::vector<LeakFinding> match_entity_name(const MatchContext &context) {
  if (context.entity_name == records::SENTINEL_ENTITY_NAME) {
    return {};
  }
  if (!mentions(context, context.entity_name)) {
    return {};
  }
  return {finding(LeakCategory::EntityNames, context, context.entity_name)};
}

std::vector<LeakFinding> match_products(const MatchContext &context) {
  std::vector<LeakFinding> out;
  for (const auto &product : context.record.products) {
    if (mentions(context, product.name)) {
      out.push_back(finding(LeakCategory::ProductNames, context, product.name));
    }

    if (!product.revenue_note.has_value() || product.revenue_note->empty()) {
      continue;
    }
    // Any single token of the revenue note counts; the note is short and specific.
    for (const auto &token : common::split_whitespace(*product.revenue_note)) {
      if (mentions(context, token)) {
        out.push_back(finding(LeakCategory::SensitiveMetrics, context,
                              "Product revenue - " + *product.revenue_note));
        break;
      }
    }
  }
  return out;
}

std::vector<LeakFinding> match_partnerships(const MatchContext &context) {
  std::vector<LeakFinding> out;
  for (const auto &partnership : context.record.partnerships) {
    if (mentions(context, partnership.partner_name)) {
      out.push_back(finding(LeakCategory::Partnerships, context, partnership.partner_name));
    }

    if (!partnership.details.has_value() ||
        common::utf8_length(*partnership.details) <= kMinPartnershipDetailsLength) {
      continue;
    }
    const std::string phrase = leading_phrase(*partnership.details, kPartnershipPhraseWords);
    if (!phrase.empty() && common::contains(context.doc_lc, phrase)) {
      out.push_back(finding(LeakCategory::Partnerships, context,
                            "Partnership details with " + partnership.partner_name));
    }
  }
  return out;
}

std::vector<LeakFinding> match_methodologies(const MatchContext &context) {
  return match_members(context, context.record.methodologies, LeakCategory::Methodologies);
}

std::vector<LeakFinding> match_kpis(const MatchContext &context) {
  std::vector<LeakFinding> out;
  for (const auto &kpi : context.record.kpis) {
    if (kpi.empty()) {
      continue;
    }

    bool flagged = false;
    if (const auto parts = split_kpi(kpi); parts.has_value()) {
      // Numeric values are not case-folded, so they are looked up in the raw text.
      flagged = mentions(context, common::trim(parts->metric)) ||
                common::contains(context.doc_raw, parts->value);
    }
    if (flagged) {
      out.push_back(finding(LeakCategory::Kpis, context, kpi));
    }
    if (mentions(context, kpi)) {
      out.push_back(finding(LeakCategory::Kpis, context, kpi));
    }
  }
  return out;
}

std::vector<LeakFinding> match_client_profiles(const MatchContext &context) {
  return match_members(context, context.record.client_profiles, LeakCategory::ClientProfiles);
}

std::vector<LeakFinding> match_financial_estimates(const MatchContext &context) {
  std::vector<LeakFinding> out;
  const auto &estimate = context.record.financial_estimates;
  if (!estimate.has_value() || estimate->empty()) {
    return out;
  }

  for (const auto &token : extract_currency_tokens(*estimate)) {
    if (mentions(context, token)) {
      out.push_back(finding(LeakCategory::FinancialEstimates, context, *estimate));
      break;
    }
  }

  if (common::contains(common::utf8_to_lower(*estimate), "arr") &&
      common::contains(context.doc_lc, "arr")) {
    out.push_back(finding(LeakCategory::FinancialEstimates, context,
                          "Recurring revenue reference - " + *estimate));
  }
  return out;
}

std::vector<LeakFinding> match_expertise_areas(const MatchContext &context) {
  return match_members(context, context.record.expertise_areas, LeakCategory::ExpertiseAreas);
}

std::vector<LeakFinding> match_risk_category(const MatchContext &context) {
  const auto &risk = context.record.risk_category;
  if (!risk.has_value() || !mentions(context, *risk)) {
    return {};
  }
  return {finding(LeakCategory::RiskCategories, context, *risk)};
}

std::vector<LeakFinding> match_notes(const MatchContext &context) {
  std::vector<LeakFinding> out;
  const auto &notes = context.record.notes;
  if (!notes.has_value() || notes->empty()) {
    return out;
  }

  const std::string notes_lc = common::utf8_to_lower(*notes);
  for (const auto phrase : kSensitiveNotePhrases) {
    const std::string needle(phrase);
    if (common::contains(notes_lc, needle) && common::contains(context.doc_lc, needle)) {
      out.push_back(finding(LeakCategory::NotesContent, context,
                            "Contains sensitive business information about " + needle));
    }
  }
  return out;
}

} // namespace leakguard::leak
