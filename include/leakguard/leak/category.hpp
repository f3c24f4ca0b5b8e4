#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace leakguard::leak {

enum class LeakCategory {
  ProductNames,
  Partnerships,
  Methodologies,
  Kpis,
  ClientProfiles,
  FinancialEstimates,
  ExpertiseAreas,
  RiskCategories,
  NotesContent,
  EntityNames,
  SensitiveMetrics,
};

inline constexpr std::size_t kCategoryCount = 11;

/// Order in which categories are rendered, most sensitive first.
inline constexpr std::array<LeakCategory, kCategoryCount> kReportOrder = {
    LeakCategory::FinancialEstimates, LeakCategory::SensitiveMetrics,
    LeakCategory::NotesContent,       LeakCategory::Kpis,
    LeakCategory::ProductNames,       LeakCategory::Partnerships,
    LeakCategory::ClientProfiles,     LeakCategory::RiskCategories,
    LeakCategory::Methodologies,      LeakCategory::ExpertiseAreas,
    LeakCategory::EntityNames,
};

/// Stable snake_case key, e.g. "product_names".
[[nodiscard]] std::string_view category_key(LeakCategory category);

/// Heading used in rendered reports, e.g. "Internal Product Names".
[[nodiscard]] std::string_view category_title(LeakCategory category);

[[nodiscard]] std::optional<LeakCategory> category_from_key(std::string_view key);

/// Position of `category` in kReportOrder.
[[nodiscard]] std::size_t report_rank(LeakCategory category);

} // namespace leakguard::leak
