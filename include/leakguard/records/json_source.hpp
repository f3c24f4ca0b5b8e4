#pragma once

#include "leakguard/records/record_source.hpp"

#include <filesystem>

namespace leakguard::records {

/// Reads a company database JSON file on every `load()`.
class JsonRecordSource final : public IRecordSource {
public:
  explicit JsonRecordSource(std::filesystem::path path);

  [[nodiscard]] common::Result<RecordStore> load() override;
  [[nodiscard]] std::string_view name() const override { return "json"; }

  [[nodiscard]] common::Status save(const RecordStore &store) const;
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace leakguard::records
