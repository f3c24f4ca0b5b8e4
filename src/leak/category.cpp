#include "leakguard/leak/category.hpp"

namespace leakguard::leak {

std::string_view category_key(const LeakCategory category) {
  switch (category) {
  case LeakCategory::ProductNames:
    return "product_names";
  case LeakCategory::Partnerships:
    return "partnerships";
  case LeakCategory::Methodologies:
    return "methodologies";
  case LeakCategory::Kpis:
    return "kpis";
  case LeakCategory::ClientProfiles:
    return "client_profiles";
  case LeakCategory::FinancialEstimates:
    return "financial_estimates";
  case LeakCategory::ExpertiseAreas:
    return "expertise_areas";
  case LeakCategory::RiskCategories:
    return "risk_categories";
  case LeakCategory::NotesContent:
    return "notes_content";
  case LeakCategory::EntityNames:
    return "entity_names";
  case LeakCategory::SensitiveMetrics:
    return "sensitive_metrics";
  }
  return "unknown";
}

std::string_view category_title(const LeakCategory category) {
  switch (category) {
  case LeakCategory::ProductNames:
    return "Internal Product Names";
  case LeakCategory::Partnerships:
    return "Partnership Information";
  case LeakCategory::Methodologies:
    return "Internal Methodologies";
  case LeakCategory::Kpis:
    return "Key Performance Indicators";
  case LeakCategory::ClientProfiles:
    return "Client Information";
  case LeakCategory::FinancialEstimates:
    return "Financial Information";
  case LeakCategory::ExpertiseAreas:
    return "Expertise Areas";
  case LeakCategory::RiskCategories:
    return "Risk Classifications";
  case LeakCategory::NotesContent:
    return "Confidential Business Information";
  case LeakCategory::EntityNames:
    return "Entity Names";
  case LeakCategory::SensitiveMetrics:
    return "Sensitive Metrics";
  }
  return "Unknown";
}

std::optional<LeakCategory> category_from_key(const std::string_view key) {
  for (const auto category : kReportOrder) {
    if (category_key(category) == key) {
      return category;
    }
  }
  return std::nullopt;
}

std::size_t report_rank(const LeakCategory category) {
  for (std::size_t i = 0; i < kReportOrder.size(); ++i) {
    if (kReportOrder[i] == category) {
      return i;
    }
  }
  return kReportOrder.size();
}

} // namespace leakguard::leak
