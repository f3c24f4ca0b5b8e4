#include "leakguard/records/json_source.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/records/json_codec.hpp"

#include <fstream>

namespace leakguard::records {

JsonRecordSource::JsonRecordSource(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<RecordStore> JsonRecordSource::load() {
  if (!std::filesystem::exists(path_)) {
    return common::Result<RecordStore>::failure("company database not found: " + path_.string());
  }

  auto content = common::read_file(path_);
  if (!content.ok()) {
    return common::Result<RecordStore>::failure(content.error());
  }

  auto store = parse_company_database(content.value());
  if (!store.ok()) {
    return common::Result<RecordStore>::failure(path_.string() + ": " + store.error());
  }
  return store;
}

common::Status JsonRecordSource::save(const RecordStore &store) const {
  if (!path_.parent_path().empty()) {
    auto dir = common::ensure_dir(path_.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  const std::filesystem::path tmp_path = path_.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write " + tmp_path.string());
  }
  file << company_database_to_json(store);
  file.close();
  if (!file) {
    return common::Status::error("Failed to flush " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    return common::Status::error("Failed to replace " + path_.string() + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace leakguard::records
