#pragma once

#include "leakguard/common/result.hpp"
#include "leakguard/records/record.hpp"

#include <string_view>

namespace leakguard::records {

/// Supplies confidential records. Callers own the source and pass the loaded store into scans;
/// nothing in the scanning code reads records from ambient state.
class IRecordSource {
public:
  virtual ~IRecordSource() = default;

  [[nodiscard]] virtual common::Result<RecordStore> load() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class InMemoryRecordSource final : public IRecordSource {
public:
  explicit InMemoryRecordSource(RecordStore store) : store_(std::move(store)) {}

  [[nodiscard]] common::Result<RecordStore> load() override {
    return common::Result<RecordStore>::success(store_);
  }
  [[nodiscard]] std::string_view name() const override { return "memory"; }

private:
  RecordStore store_;
};

} // namespace leakguard::records
