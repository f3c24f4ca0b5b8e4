#include "leakguard/records/factory.hpp"

#include "leakguard/common/fs.hpp"
#include "leakguard/records/json_source.hpp"
#include "leakguard/records/sqlite_source.hpp"

namespace leakguard::records {

std::string backend_for_path(const std::string &path) {
  const std::string lowered = common::to_lower(path);
  if (common::ends_with(lowered, ".db") || common::ends_with(lowered, ".sqlite") ||
      common::ends_with(lowered, ".sqlite3")) {
    return "sqlite";
  }
  return "json";
}

common::Result<std::unique_ptr<IRecordSource>>
create_record_source(const config::RecordsConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  const std::string path = common::expand_path(config.path);
  if (path.empty()) {
    return common::Result<std::unique_ptr<IRecordSource>>::failure("records path is empty");
  }

  if (backend == "json") {
    return common::Result<std::unique_ptr<IRecordSource>>::success(
        std::make_unique<JsonRecordSource>(path));
  }
  if (backend == "sqlite") {
    return common::Result<std::unique_ptr<IRecordSource>>::success(
        std::make_unique<SqliteRecordSource>(path));
  }
  return common::Result<std::unique_ptr<IRecordSource>>::failure("unknown records backend: " +
                                                                 config.backend);
}

} // namespace leakguard::records
