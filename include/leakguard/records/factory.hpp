#pragma once

#include "leakguard/common/result.hpp"
#include "leakguard/config/schema.hpp"
#include "leakguard/records/record_source.hpp"

#include <memory>
#include <string>

namespace leakguard::records {

/// "sqlite" for .db / .sqlite / .sqlite3 paths, "json" otherwise.
[[nodiscard]] std::string backend_for_path(const std::string &path);

[[nodiscard]] common::Result<std::unique_ptr<IRecordSource>>
create_record_source(const config::RecordsConfig &config);

} // namespace leakguard::records
