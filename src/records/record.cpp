#include "leakguard/records/record.hpp"

#include "leakguard/common/fs.hpp"

#include <algorithm>
#include <array>

namespace leakguard::records {

bool is_known_risk_category(const std::string &value) {
  static const std::array<std::string, 4> kRiskCategories = {"low", "medium", "high", "critical"};
  const std::string normalized = common::to_lower(common::trim(value));
  return std::find(kRiskCategories.begin(), kRiskCategories.end(), normalized) !=
         kRiskCategories.end();
}

RecordStore::RecordStore(std::vector<ConfidentialRecord> records) {
  for (auto &record : records) {
    add(std::move(record));
  }
}

void RecordStore::add(ConfidentialRecord record) {
  for (auto &existing : records_) {
    if (existing.entity_name == record.entity_name) {
      existing = std::move(record);
      return;
    }
  }
  records_.push_back(std::move(record));
}

const ConfidentialRecord *RecordStore::find(const std::string &entity_name) const {
  for (const auto &record : records_) {
    if (record.entity_name == entity_name) {
      return &record;
    }
  }
  return nullptr;
}

std::vector<std::string> RecordStore::names() const {
  std::vector<std::string> out;
  out.reserve(records_.size());
  for (const auto &record : records_) {
    out.push_back(record.entity_name);
  }
  return out;
}

} // namespace leakguard::records
