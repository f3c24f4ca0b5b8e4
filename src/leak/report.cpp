#include "leakguard/leak/report.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/common/json_util.hpp"
#include "leakguard/common/utf8.hpp"
#include "leakguard/leak/matchers.hpp"

#include <array>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace leakguard::leak {

namespace {

constexpr const char *kReportHeader = "=== SECURITY REPORT: INTERNAL INFORMATION DETECTION ===";

/// Per-category buckets that drop exact duplicates and keep first-seen order.
class FindingCollector {
public:
  void add(LeakFinding finding) {
    std::string key(category_key(finding.category));
    key.push_back('\x1f');
    key += finding.entity_name;
    key.push_back('\x1f');
    key += finding.detail;
    if (!seen_.insert(std::move(key)).second) {
      return;
    }
    buckets_[report_rank(finding.category)].push_back(std::move(finding));
  }

  LeakReport finish() {
    LeakReport report;
    for (auto &bucket : buckets_) {
      for (auto &finding : bucket) {
        report.findings.push_back(std::move(finding));
      }
    }
    report.total_count = report.findings.size();
    report.severity = severity_for_count(report.total_count);
    return report;
  }

private:
  std::array<std::vector<LeakFinding>, kCategoryCount> buckets_;
  std::unordered_set<std::string> seen_;
};

void scan_record(const std::string &document, const std::string &document_lc,
                 const std::string &entity_name, const records::ConfidentialRecord &record,
                 FindingCollector &collector) {
  const MatchContext context{document, document_lc, entity_name, record};
  for (const auto &entry : matcher_registry()) {
    for (auto &finding : entry.fn(context)) {
      collector.add(std::move(finding));
    }
  }
}

} // namespace

Severity severity_for_count(const std::size_t count) {
  if (count == 0) {
    return Severity::None;
  }
  if (count >= kHighThreshold) {
    return Severity::High;
  }
  if (count >= kMediumThreshold) {
    return Severity::Medium;
  }
  return Severity::Low;
}

std::string_view severity_label(const Severity severity) {
  switch (severity) {
  case Severity::None:
    return "NONE";
  case Severity::Low:
    return "LOW";
  case Severity::Medium:
    return "MEDIUM";
  case Severity::High:
    return "HIGH";
  }
  return "NONE";
}

LeakReport build_leak_report(const std::string &document, const records::RecordStore &store) {
  const std::string document_lc = common::utf8_to_lower(document);
  FindingCollector collector;
  for (const auto &record : store.records()) {
    scan_record(document, document_lc, record.entity_name, record, collector);
  }
  return collector.finish();
}

LeakReport build_leak_report(const std::string &document,
                             const records::ConfidentialRecord &record) {
  const std::string document_lc = common::utf8_to_lower(document);
  const std::string sentinel = records::SENTINEL_ENTITY_NAME;
  FindingCollector collector;
  scan_record(document, document_lc, sentinel, record, collector);
  return collector.finish();
}

std::vector<LeakFinding> findings_in(const LeakReport &report, const LeakCategory category) {
  std::vector<LeakFinding> out;
  for (const auto &finding : report.findings) {
    if (finding.category == category) {
      out.push_back(finding);
    }
  }
  return out;
}

std::string render_report(const LeakReport &report) {
  std::ostringstream out;
  out << kReportHeader << "\n\n";

  if (report.total_count == 0) {
    out << "No internal information detected in the document.\n";
    out << "The document appears safe for external sharing.";
    return out.str();
  }

  out << severity_label(report.severity) << " RISK: " << report.total_count
      << " potential information leak(s) detected!\n";

  // Findings are already grouped in report order.
  std::optional<LeakCategory> current;
  for (const auto &finding : report.findings) {
    if (!current.has_value() || *current != finding.category) {
      current = finding.category;
      out << "\n" << category_title(finding.category) << ":\n";
    }
    out << "  - " << finding.entity_name << ": " << finding.detail << "\n";
  }

  out << "\n" << std::string(60, '=') << "\n";
  out << "RECOMMENDATIONS:\n";
  switch (report.severity) {
  case Severity::High:
    out << "- DO NOT SHARE externally without review\n";
    out << "- Requires immediate security review\n";
    break;
  case Severity::Medium:
    out << "- Requires review before external sharing\n";
    out << "- Consider redacting sensitive information\n";
    break;
  case Severity::Low:
  case Severity::None:
    out << "- Minor concerns - review recommended\n";
    break;
  }
  out << "- Verify all flagged information is appropriate for the target audience";
  return out.str();
}

std::string report_to_json(const LeakReport &report, const std::string &document_sha256) {
  std::ostringstream out;
  out << "{\"severity\":\"" << severity_label(report.severity) << "\""
      << ",\"total_count\":" << report.total_count << ",\"document_sha256\":\""
      << common::json_escape(document_sha256) << "\",\"findings\":[";
  for (std::size_t i = 0; i < report.findings.size(); ++i) {
    const auto &finding = report.findings[i];
    if (i > 0) {
      out << ',';
    }
    out << "{\"category\":\"" << category_key(finding.category) << "\",\"entity\":\""
        << common::json_escape(finding.entity_name) << "\",\"detail\":\""
        << common::json_escape(finding.detail) << "\"}";
  }
  out << "]}";
  return out.str();
}

} // namespace leakguard::leak
