#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace leakguard::records {

/// Name used when a single record is scanned without its real entity name. Never reported as an
/// entity-name leak.
inline constexpr const char *SENTINEL_ENTITY_NAME = "Target Company";

struct Product {
  std::string name;
  std::optional<std::string> revenue_note;
};

struct Partnership {
  std::string partner_name;
  std::optional<std::string> relationship_type;
  std::optional<std::string> details;
};

/// Confidential fields of one entity. Every category is optional; empty means absent.
struct ConfidentialRecord {
  std::string entity_name;
  std::optional<std::string> industry;
  std::vector<Product> products;
  std::vector<Partnership> partnerships;
  std::vector<std::string> methodologies;
  std::vector<std::string> kpis;
  std::vector<std::string> client_profiles;
  std::optional<std::string> financial_estimates;
  std::vector<std::string> expertise_areas;
  std::optional<std::string> risk_category;
  std::optional<std::string> notes;
};

/// Returns true when `value` is one of Low, Medium, High, Critical (case-insensitive).
[[nodiscard]] bool is_known_risk_category(const std::string &value);

/// Insertion-ordered, read-only view of records keyed by entity name.
class RecordStore {
public:
  RecordStore() = default;
  explicit RecordStore(std::vector<ConfidentialRecord> records);

  /// Adds `record`, replacing an existing record with the same entity name in place.
  void add(ConfidentialRecord record);

  [[nodiscard]] const ConfidentialRecord *find(const std::string &entity_name) const;
  [[nodiscard]] const std::vector<ConfidentialRecord> &records() const { return records_; }
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return records_.size(); }
  [[nodiscard]] bool empty() const { return records_.empty(); }

private:
  std::vector<ConfidentialRecord> records_;
};

} // namespace leakguard::records
