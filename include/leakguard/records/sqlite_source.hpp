#pragma once

#include "leakguard/records/record_source.hpp"

#include <filesystem>
#include <sqlite3.h>

namespace leakguard::records {

/// Records kept one row per entity, fields stored as the JSON `internal` object.
class SqliteRecordSource final : public IRecordSource {
public:
  explicit SqliteRecordSource(std::filesystem::path db_path);
  ~SqliteRecordSource() override;

  SqliteRecordSource(const SqliteRecordSource &) = delete;
  SqliteRecordSource &operator=(const SqliteRecordSource &) = delete;

  [[nodiscard]] common::Result<RecordStore> load() override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] common::Status put(const ConfidentialRecord &record);
  [[nodiscard]] common::Status put_all(const RecordStore &store);
  [[nodiscard]] common::Result<bool> remove(const std::string &entity_name);
  [[nodiscard]] common::Result<std::size_t> count();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
};

} // namespace leakguard::records
