#pragma once

#include "leakguard/leak/finding.hpp"
#include "leakguard/records/record.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace leakguard::leak {

enum class Severity { None, Low, Medium, High };

/// Finding counts at which severity steps up. Calibrated against substring matching; fixed.
inline constexpr std::size_t kMediumThreshold = 5;
inline constexpr std::size_t kHighThreshold = 10;

struct LeakReport {
  std::vector<LeakFinding> findings;
  std::size_t total_count = 0;
  Severity severity = Severity::None;
};

[[nodiscard]] Severity severity_for_count(std::size_t count);

/// "NONE", "LOW", "MEDIUM" or "HIGH".
[[nodiscard]] std::string_view severity_label(Severity severity);

/// Scans `document` against every record in `store`. Findings are grouped in kReportOrder,
/// first-seen order within a category, exact duplicates dropped.
[[nodiscard]] LeakReport build_leak_report(const std::string &document,
                                           const records::RecordStore &store);

/// Scans a single record under the sentinel entity name, so the record's own name is never
/// reported.
[[nodiscard]] LeakReport build_leak_report(const std::string &document,
                                           const records::ConfidentialRecord &record);

[[nodiscard]] std::vector<LeakFinding> findings_in(const LeakReport &report,
                                                   LeakCategory category);

/// Human-readable report with per-category sections and severity-dependent recommendations.
[[nodiscard]] std::string render_report(const LeakReport &report);

[[nodiscard]] std::string report_to_json(const LeakReport &report,
                                         const std::string &document_sha256);

} // namespace leakguard::leak
