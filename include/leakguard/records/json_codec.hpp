#pragma once

#include "leakguard/common/result.hpp"
#include "leakguard/records/record.hpp"

#include <string>

namespace leakguard::records {

/// Parses the `internal` object of one company-database entry. Missing or null fields are
/// left absent. Fails only when `internal_json` is not a JSON object.
[[nodiscard]] common::Result<ConfidentialRecord> parse_record_json(const std::string &entity_name,
                                                                   const std::string &internal_json);

/// Serialises the record fields in the same layout `parse_record_json` reads. The entity name
/// is not part of the object.
[[nodiscard]] std::string record_to_json(const ConfidentialRecord &record);

/// Parses a whole company database: `{"<entity>": {"internal": {...}, "external": {...}}, ...}`.
/// Entries without an `internal` object become records with every field absent.
[[nodiscard]] common::Result<RecordStore> parse_company_database(const std::string &json);

[[nodiscard]] std::string company_database_to_json(const RecordStore &store);

} // namespace leakguard::records
